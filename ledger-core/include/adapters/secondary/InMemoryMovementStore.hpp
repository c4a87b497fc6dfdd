#pragma once

#include "ports/output/IMovementStore.hpp"
#include "domain/Errors.hpp"
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory хранилище движений (только добавление)
 *
 * Читатели берут shared_lock и никогда не ждут критическую секцию
 * StockService. Пачка добавляется под одним unique_lock, поэтому
 * частично записанная пачка не видна.
 */
class InMemoryMovementStore : public ports::output::IMovementStore {
public:
    InMemoryMovementStore() {
        std::cout << "[InMemoryMovementStore] Created" << std::endl;
    }

    std::string append(const domain::Movement& movement) override {
        return appendAll({movement}).front();
    }

    std::vector<std::string> appendAll(const std::vector<domain::Movement>& movements) override {
        if (movements.empty()) {
            throw domain::ValidationError("Movement batch is empty");
        }
        for (const auto& m : movements) {
            validate(m);
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);

        std::unordered_set<std::string> batchIds;
        for (const auto& m : movements) {
            if (byId_.count(m.id()) > 0 || !batchIds.insert(m.id()).second) {
                throw domain::ImmutableRecordViolation("Movement already exists: " + m.id());
            }
        }

        std::vector<std::string> ids;
        ids.reserve(movements.size());
        for (const auto& m : movements) {
            size_t index = movements_.size();
            movements_.push_back(m);
            byId_[m.id()] = index;
            byKey_[m.key()].push_back(index);
            if (!m.reference().id.empty()) {
                byReference_[m.reference().id].push_back(index);
            }
            ids.push_back(m.id());
        }
        return ids;
    }

    std::vector<domain::Movement> queryOrdered(const domain::StockKey& key) const override {
        std::vector<domain::Movement> result;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = byKey_.find(key);
            if (it == byKey_.end()) {
                return result;
            }
            result.reserve(it->second.size());
            for (size_t index : it->second) {
                result.push_back(movements_[index]);
            }
        }
        // Порядок добавления может расходиться с временем создания
        // у движений, подготовленных параллельно
        std::stable_sort(result.begin(), result.end(),
            [](const domain::Movement& a, const domain::Movement& b) {
                return a.createdAt() < b.createdAt();
            });
        return result;
    }

    std::optional<domain::Movement> findById(const std::string& id) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = byId_.find(id);
        if (it == byId_.end()) return std::nullopt;
        return movements_[it->second];
    }

    std::vector<domain::Movement> findByReference(const std::string& referenceId) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::Movement> result;
        auto it = byReference_.find(referenceId);
        if (it != byReference_.end()) {
            for (size_t index : it->second) {
                result.push_back(movements_[index]);
            }
        }
        return result;
    }

    size_t count() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return movements_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::vector<domain::Movement> movements_;
    std::unordered_map<std::string, size_t> byId_;
    std::unordered_map<domain::StockKey, std::vector<size_t>> byKey_;
    std::unordered_map<std::string, std::vector<size_t>> byReference_;

    static void validate(const domain::Movement& m) {
        if (m.id().empty()) {
            throw domain::ValidationError("Movement id is required");
        }
        if (!domain::isKnown(m.kind())) {
            throw domain::ValidationError("Unknown movement kind");
        }
        if (!domain::isKnown(m.entity().kind)) {
            throw domain::ValidationError("Unknown entity kind");
        }
        if (m.kind() == domain::MovementKind::ADJUSTMENT) {
            if (m.quantity() == 0) {
                throw domain::ValidationError("Adjustment quantity must be non-zero");
            }
        } else if (m.quantity() <= 0) {
            throw domain::ValidationError("Quantity must be positive");
        }
    }
};

} // namespace ledger::adapters::secondary
