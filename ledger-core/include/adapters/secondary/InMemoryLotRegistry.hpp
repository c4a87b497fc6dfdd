#pragma once

#include "ports/output/ILotRegistry.hpp"
#include <unordered_map>
#include <mutex>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реестр партий
 *
 * Неизвестная партия считается непригодной.
 */
class InMemoryLotRegistry : public ports::output::ILotRegistry {
public:
    void setUsable(const std::string& lotId, bool usable) {
        std::lock_guard<std::mutex> lock(mutex_);
        lots_[lotId] = usable;
    }

    bool isLotUsable(const std::string& lotId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lots_.find(lotId);
        return it != lots_.end() && it->second;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, bool> lots_;
};

} // namespace ledger::adapters::secondary
