#pragma once

#include "EntityRef.hpp"
#include "Money.hpp"
#include "Reference.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Оптовая поставка: движение товара + финансовая проводка
 */
struct TransferRequest {
    EntityRef seller;
    EntityRef buyer;
    std::string lotId;
    int64_t quantity = 0;
    Money unitValue;
    Reference reference;
    std::string actorId;
    std::optional<bool> lotUsable;
    std::string date;               ///< Дата проводки; пусто - сегодня
};

struct TransferResult {
    std::string outMovementId;
    std::string inMovementId;
    std::string journalEntryId;
};

} // namespace ledger::domain
