#pragma once

#include <string>

namespace ledger::domain {

enum class AccountClass {
    ASSET,
    LIABILITY,
    EQUITY,
    REVENUE,
    EXPENSE
};

inline std::string toString(AccountClass accountClass) {
    switch (accountClass) {
        case AccountClass::ASSET: return "ASSET";
        case AccountClass::LIABILITY: return "LIABILITY";
        case AccountClass::EQUITY: return "EQUITY";
        case AccountClass::REVENUE: return "REVENUE";
        case AccountClass::EXPENSE: return "EXPENSE";
        default: return "UNKNOWN";
    }
}

} // namespace ledger::domain
