#pragma once

#include "ports/output/IAuditSink.hpp"
#include <mutex>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory журнал аудита
 */
class InMemoryAuditSink : public ports::output::IAuditSink {
public:
    void record(const domain::AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    void recordAll(const std::vector<domain::AuditRecord>& records) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.insert(records_.end(), records.begin(), records.end());
    }

    std::vector<domain::AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::AuditRecord> records_;
};

} // namespace ledger::adapters::secondary
