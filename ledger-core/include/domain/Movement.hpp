#pragma once

#include "EntityRef.hpp"
#include "Reference.hpp"
#include "Timestamp.hpp"
#include "enums/MovementKind.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Движение запасов - неизменяемый факт
 *
 * Все поля задаются конструктором и доступны только на чтение.
 * Для ADJUSTMENT количество знаковое (минус - списание),
 * для остальных типов строго положительное.
 */
class Movement {
public:
    Movement(std::string id,
             StockKey key,
             MovementKind kind,
             int64_t quantity,
             Reference reference,
             std::string actorId,
             Timestamp createdAt)
        : id_(std::move(id))
        , key_(std::move(key))
        , kind_(kind)
        , quantity_(quantity)
        , reference_(std::move(reference))
        , actorId_(std::move(actorId))
        , createdAt_(createdAt)
    {}

    const std::string& id() const { return id_; }
    const StockKey& key() const { return key_; }
    const EntityRef& entity() const { return key_.entity; }
    const std::string& lotId() const { return key_.lotId; }
    MovementKind kind() const { return kind_; }
    int64_t quantity() const { return quantity_; }
    const Reference& reference() const { return reference_; }
    const std::string& actorId() const { return actorId_; }
    const Timestamp& createdAt() const { return createdAt_; }

    /**
     * @brief Вклад движения в остаток: приход +, расход -, корректировка со своим знаком
     */
    int64_t signedQuantity() const {
        if (isInbound(kind_)) return quantity_;
        if (isOutbound(kind_)) return -quantity_;
        return quantity_;
    }

private:
    std::string id_;
    StockKey key_;
    MovementKind kind_;
    int64_t quantity_;
    Reference reference_;
    std::string actorId_;
    Timestamp createdAt_;
};

} // namespace ledger::domain
