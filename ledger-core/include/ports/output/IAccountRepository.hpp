#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @throws ValidationError если код уже занят другим счётом
     */
    virtual domain::Account save(const domain::Account& account) = 0;
    virtual std::optional<domain::Account> findById(const std::string& id) const = 0;
    virtual std::optional<domain::Account> findByCode(const std::string& code) const = 0;
    virtual std::vector<domain::Account> findByOwner(const domain::EntityRef& owner) const = 0;
};

} // namespace ledger::ports::output
