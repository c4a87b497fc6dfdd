#pragma once

#include "EntityRef.hpp"
#include "enums/AccountClass.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Счёт плана счетов
 *
 * Создаётся конфигурацией, а не проводками. owner пуст у системных счетов.
 */
struct Account {
    std::string id;
    AccountClass accountClass = AccountClass::ASSET;
    std::string code;                   ///< Уникальный код ("1300-RP-001")
    std::optional<EntityRef> owner;
};

/**
 * @brief Счета держателя, участвующие в передаче товара
 */
struct AccountSet {
    std::string receivable;
    std::string payable;
    std::string inventory;
    std::string revenue;
};

} // namespace ledger::domain
