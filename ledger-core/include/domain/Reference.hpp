#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Ссылка на бизнес-событие, породившее запись (заказ, продажа, отзыв)
 *
 * Ядро не разрешает ссылку и не хранит внешний ключ; оба поля могут быть пустыми.
 */
struct Reference {
    std::string id;
    std::string kind;
};

} // namespace ledger::domain
