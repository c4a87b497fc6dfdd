#pragma once

#include "domain/AuditRecord.hpp"
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Приёмник аудита
 *
 * Вызывается синхронно как часть единицы работы. Исключение из record()
 * отменяет всю операцию (fail-closed).
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual void record(const domain::AuditRecord& record) = 0;

    /**
     * @brief Записать пачку одной единицей: сохраняется вся пачка или ничего
     */
    virtual void recordAll(const std::vector<domain::AuditRecord>& records) = 0;
};

} // namespace ledger::ports::output
