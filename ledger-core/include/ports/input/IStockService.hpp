#pragma once

#include "domain/Movement.hpp"
#include "domain/MovementRequest.hpp"
#include <vector>
#include <utility>
#include <optional>
#include <string>

namespace ledger::ports::input {

/**
 * @brief Учёт движений запасов
 */
class IStockService {
public:
    virtual ~IStockService() = default;

    /**
     * @brief Записать движение; расход проверяет остаток в критической секции
     * @throws ValidationError, LotUnusableError, InsufficientStockError, ConcurrencyConflict
     */
    virtual domain::Movement recordMovement(const domain::MovementRequest& request) = 0;

    /**
     * @brief Корректировка со знаковым количеством (минус - списание)
     */
    virtual domain::Movement recordAdjustment(
        const domain::EntityRef& entity,
        const std::string& lotId,
        int64_t signedQuantity,
        const domain::Reference& reference,
        const std::string& actorId,
        std::optional<bool> lotUsable = std::nullopt) = 0;

    /**
     * @brief Атомарно: расход у продавца и приход у покупателя
     * @return (TRANSFER_OUT, TRANSFER_IN)
     */
    virtual std::pair<domain::Movement, domain::Movement> processDualMovement(
        const domain::DualMovementRequest& request) = 0;

    /**
     * @brief Розничная продажа (SALE)
     */
    virtual domain::Movement processSingleSale(
        const domain::EntityRef& entity,
        const std::string& lotId,
        int64_t quantity,
        const domain::Reference& reference,
        const std::string& actorId,
        std::optional<bool> lotUsable = std::nullopt) = 0;

    virtual int64_t getBalance(const domain::EntityRef& entity, const std::string& lotId) = 0;

    virtual std::vector<domain::Movement> getMovementHistory(
        const domain::EntityRef& entity,
        const std::string& lotId) = 0;

    virtual std::vector<domain::Movement> getMovementsByReference(const std::string& referenceId) = 0;
};

} // namespace ledger::ports::input
