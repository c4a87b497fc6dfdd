#pragma once

#include "domain/TransferRequest.hpp"

namespace ledger::ports::input {

/**
 * @brief Межучётные операции: товар и деньги одной единицей работы
 */
class ILedgerCoordinator {
public:
    virtual ~ILedgerCoordinator() = default;

    /**
     * @brief Поставка: два движения + проведённая запись, либо ничего
     */
    virtual domain::TransferResult executeTransfer(const domain::TransferRequest& request) = 0;
};

} // namespace ledger::ports::input
