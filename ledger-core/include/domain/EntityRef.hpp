#pragma once

#include "enums/EntityKind.hpp"
#include <string>
#include <tuple>
#include <functional>

namespace ledger::domain {

/**
 * @brief Держатель запасов: вид + непрозрачный идентификатор
 *
 * Порядок (вид, затем id) задаёт каноничный порядок захвата блокировок.
 */
struct EntityRef {
    EntityKind kind = EntityKind::RETAIL_PHARMACY;
    std::string id;

    std::string toString() const {
        return domain::toString(kind) + ":" + id;
    }

    bool operator==(const EntityRef& other) const {
        return kind == other.kind && id == other.id;
    }

    bool operator!=(const EntityRef& other) const {
        return !(*this == other);
    }

    bool operator<(const EntityRef& other) const {
        return std::tie(kind, id) < std::tie(other.kind, other.id);
    }
};

/**
 * @brief Единица изоляции: (держатель, партия)
 */
struct StockKey {
    EntityRef entity;
    std::string lotId;

    std::string toString() const {
        return entity.toString() + "/" + lotId;
    }

    bool operator==(const StockKey& other) const {
        return entity == other.entity && lotId == other.lotId;
    }

    bool operator<(const StockKey& other) const {
        return std::tie(entity, lotId) < std::tie(other.entity, other.lotId);
    }
};

} // namespace ledger::domain

namespace std {

template <>
struct hash<ledger::domain::StockKey> {
    size_t operator()(const ledger::domain::StockKey& key) const noexcept {
        size_t h = hash<int>{}(static_cast<int>(key.entity.kind));
        h ^= hash<string>{}(key.entity.id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= hash<string>{}(key.lotId) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
