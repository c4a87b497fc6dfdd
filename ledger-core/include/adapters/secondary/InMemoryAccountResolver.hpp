#pragma once

#include "ports/output/IAccountResolver.hpp"
#include <map>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory привязка держателей к их счетам
 */
class InMemoryAccountResolver : public ports::output::IAccountResolver {
public:
    void assign(const domain::EntityRef& entity, const domain::AccountSet& accounts) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_[entity] = accounts;
    }

    std::optional<domain::AccountSet> accountsFor(const domain::EntityRef& entity) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(entity);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<domain::EntityRef, domain::AccountSet> accounts_;
};

} // namespace ledger::adapters::secondary
