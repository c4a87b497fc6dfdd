#pragma once

#include "domain/Errors.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Вид держателя запасов
 */
enum class EntityKind {
    WHOLESALE_PHARMACY,
    RETAIL_PHARMACY,
    PUBLIC_FACILITY
};

inline bool isKnown(EntityKind kind) {
    switch (kind) {
        case EntityKind::WHOLESALE_PHARMACY:
        case EntityKind::RETAIL_PHARMACY:
        case EntityKind::PUBLIC_FACILITY:
            return true;
    }
    return false;
}

inline std::string toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::WHOLESALE_PHARMACY: return "WHOLESALE_PHARMACY";
        case EntityKind::RETAIL_PHARMACY: return "RETAIL_PHARMACY";
        case EntityKind::PUBLIC_FACILITY: return "PUBLIC_FACILITY";
        default: return "UNKNOWN";
    }
}

inline EntityKind parseEntityKind(const std::string& str) {
    if (str == "WHOLESALE_PHARMACY") return EntityKind::WHOLESALE_PHARMACY;
    if (str == "RETAIL_PHARMACY") return EntityKind::RETAIL_PHARMACY;
    if (str == "PUBLIC_FACILITY") return EntityKind::PUBLIC_FACILITY;
    throw ValidationError("Unknown entity kind: " + str);
}

} // namespace ledger::domain
