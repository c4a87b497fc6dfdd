#pragma once

#include "domain/Account.hpp"
#include "domain/EntityRef.hpp"
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Разрешение счетов держателя по плану счетов (внешний)
 */
class IAccountResolver {
public:
    virtual ~IAccountResolver() = default;
    virtual std::optional<domain::AccountSet> accountsFor(const domain::EntityRef& entity) = 0;
};

} // namespace ledger::ports::output
