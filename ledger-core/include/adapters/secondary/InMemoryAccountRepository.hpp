#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/Errors.hpp"
#include <ThreadSafeMap.hpp>
#include <unordered_map>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory план счетов
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    domain::Account save(const domain::Account& account) override {
        if (account.id.empty() || account.code.empty()) {
            throw domain::ValidationError("Account id and code are required");
        }

        std::lock_guard<std::mutex> lock(indexMutex_);
        auto it = codeIndex_.find(account.code);
        if (it != codeIndex_.end() && it->second != account.id) {
            throw domain::ValidationError("Account code already in use: " + account.code);
        }
        if (auto previous = accounts_.find(account.id)) {
            codeIndex_.erase(previous->code);
        }
        accounts_.insert(account.id, std::make_shared<domain::Account>(account));
        codeIndex_[account.code] = account.id;
        return account;
    }

    std::optional<domain::Account> findById(const std::string& id) const override {
        auto account = accounts_.find(id);
        return account ? std::optional(*account) : std::nullopt;
    }

    std::optional<domain::Account> findByCode(const std::string& code) const override {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = codeIndex_.find(code);
            if (it == codeIndex_.end()) return std::nullopt;
            id = it->second;
        }
        return findById(id);
    }

    std::vector<domain::Account> findByOwner(const domain::EntityRef& owner) const override {
        std::vector<domain::Account> result;
        for (const auto& account : accounts_.values()) {
            if (account->owner && *account->owner == owner) {
                result.push_back(*account);
            }
        }
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;
    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::string> codeIndex_;
};

} // namespace ledger::adapters::secondary
