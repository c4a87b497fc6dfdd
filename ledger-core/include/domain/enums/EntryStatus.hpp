#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Статус записи журнала
 *
 * DRAFT -> POSTED, обратного перехода нет.
 */
enum class EntryStatus {
    DRAFT,
    POSTED
};

inline std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::DRAFT: return "DRAFT";
        case EntryStatus::POSTED: return "POSTED";
        default: return "UNKNOWN";
    }
}

} // namespace ledger::domain
