#pragma once

#include "EntityRef.hpp"
#include "Reference.hpp"
#include "enums/MovementKind.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Запрос на запись одного движения
 *
 * lotUsable - ответ реестра партий, полученный вызывающим. Если не задан,
 * StockService сам спросит реестр до входа в критическую секцию.
 */
struct MovementRequest {
    EntityRef entity;
    std::string lotId;
    MovementKind kind = MovementKind::IMPORT;
    int64_t quantity = 0;
    Reference reference;
    std::string actorId;
    std::optional<bool> lotUsable;
};

/**
 * @brief Запрос на парное движение продавец -> покупатель
 */
struct DualMovementRequest {
    EntityRef seller;
    EntityRef buyer;
    std::string lotId;
    int64_t quantity = 0;
    Reference reference;
    std::string actorId;
    std::optional<bool> lotUsable;
};

} // namespace ledger::domain
