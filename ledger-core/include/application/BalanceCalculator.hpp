#pragma once

#include "ports/output/IMovementStore.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <vector>
#include <cstdint>

namespace ledger::application {

/**
 * @brief Вычисление остатка по (держатель, партия)
 *
 * Остаток нигде не хранится: сумма приходов минус сумма расходов
 * плюс знаковые корректировки. Чистая функция от сохранённых движений.
 */
class BalanceCalculator {
public:
    explicit BalanceCalculator(std::shared_ptr<ports::output::IMovementStore> store)
        : store_(std::move(store)) {}

    int64_t computeBalance(const domain::StockKey& key) const {
        return sum(store_->queryOrdered(key));
    }

    int64_t computeBalance(const domain::EntityRef& entity, const std::string& lotId) const {
        return computeBalance(domain::StockKey{entity, lotId});
    }

    /**
     * @throws ValidationError если сумма выходит за int64
     */
    static int64_t sum(const std::vector<domain::Movement>& movements) {
        int64_t balance = 0;
        for (const auto& m : movements) {
            if (__builtin_add_overflow(balance, m.signedQuantity(), &balance)) {
                throw domain::ValidationError("Balance out of range for " + m.key().toString());
            }
        }
        return balance;
    }

private:
    std::shared_ptr<ports::output::IMovementStore> store_;
};

} // namespace ledger::application
