#pragma once

#include "domain/Movement.hpp"
#include "domain/EntityRef.hpp"
#include <vector>
#include <optional>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Хранилище движений - только добавление
 *
 * Операций изменения и удаления в контракте нет. Повторное добавление
 * существующего id считается попыткой перезаписи (ImmutableRecordViolation).
 */
class IMovementStore {
public:
    virtual ~IMovementStore() = default;

    /**
     * @throws ValidationError при неположительном количестве или неизвестном типе
     */
    virtual std::string append(const domain::Movement& movement) = 0;

    /**
     * @brief Атомарно добавить пачку: читатели видят либо все движения, либо ни одного
     */
    virtual std::vector<std::string> appendAll(const std::vector<domain::Movement>& movements) = 0;

    /**
     * @brief Движения по ключу в порядке создания; каждый вызов читает текущее состояние
     */
    virtual std::vector<domain::Movement> queryOrdered(const domain::StockKey& key) const = 0;

    virtual std::optional<domain::Movement> findById(const std::string& id) const = 0;
    virtual std::vector<domain::Movement> findByReference(const std::string& referenceId) const = 0;
    virtual size_t count() const = 0;
};

} // namespace ledger::ports::output
