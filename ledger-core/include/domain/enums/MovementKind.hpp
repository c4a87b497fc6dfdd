#pragma once

#include "domain/Errors.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Тип движения запасов
 *
 * Приход: IMPORT, TRANSFER_IN, RETURN.
 * Расход: TRANSFER_OUT, SALE, RECALL_REMOVAL.
 * ADJUSTMENT несёт знаковое количество, заданное вызывающим.
 */
enum class MovementKind {
    IMPORT,
    TRANSFER_IN,
    TRANSFER_OUT,
    SALE,
    RETURN,
    ADJUSTMENT,
    RECALL_REMOVAL
};

inline bool isKnown(MovementKind kind) {
    switch (kind) {
        case MovementKind::IMPORT:
        case MovementKind::TRANSFER_IN:
        case MovementKind::TRANSFER_OUT:
        case MovementKind::SALE:
        case MovementKind::RETURN:
        case MovementKind::ADJUSTMENT:
        case MovementKind::RECALL_REMOVAL:
            return true;
    }
    return false;
}

inline bool isInbound(MovementKind kind) {
    return kind == MovementKind::IMPORT
        || kind == MovementKind::TRANSFER_IN
        || kind == MovementKind::RETURN;
}

inline bool isOutbound(MovementKind kind) {
    return kind == MovementKind::TRANSFER_OUT
        || kind == MovementKind::SALE
        || kind == MovementKind::RECALL_REMOVAL;
}

inline std::string toString(MovementKind kind) {
    switch (kind) {
        case MovementKind::IMPORT: return "IMPORT";
        case MovementKind::TRANSFER_IN: return "TRANSFER_IN";
        case MovementKind::TRANSFER_OUT: return "TRANSFER_OUT";
        case MovementKind::SALE: return "SALE";
        case MovementKind::RETURN: return "RETURN";
        case MovementKind::ADJUSTMENT: return "ADJUSTMENT";
        case MovementKind::RECALL_REMOVAL: return "RECALL_REMOVAL";
        default: return "UNKNOWN";
    }
}

inline MovementKind parseMovementKind(const std::string& str) {
    if (str == "IMPORT") return MovementKind::IMPORT;
    if (str == "TRANSFER_IN") return MovementKind::TRANSFER_IN;
    if (str == "TRANSFER_OUT") return MovementKind::TRANSFER_OUT;
    if (str == "SALE") return MovementKind::SALE;
    if (str == "RETURN") return MovementKind::RETURN;
    if (str == "ADJUSTMENT") return MovementKind::ADJUSTMENT;
    if (str == "RECALL_REMOVAL") return MovementKind::RECALL_REMOVAL;
    throw ValidationError("Unknown movement kind: " + str);
}

} // namespace ledger::domain
