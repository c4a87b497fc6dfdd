#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Реестр партий и лекарств (внешний)
 *
 * Почему партия непригодна (блокировка, истёк срок, отзыв) - забота реестра.
 */
class ILotRegistry {
public:
    virtual ~ILotRegistry() = default;
    virtual bool isLotUsable(const std::string& lotId) = 0;
};

} // namespace ledger::ports::output
