#pragma once

#include <shared_mutex>
#include <mutex>

namespace ledger::application {

/**
 * @brief Общая точка публикации для хранилища движений и журнала
 *
 * Запись, затрагивающая оба хранилища, публикует их под publish().
 * Публичные чтения сервисов идут под read(), поэтому читатель видит
 * единицу работы целиком или не видит её вовсе.
 *
 * Не реентерабельна: под read() нельзя вызывать другие чтения через gate.
 */
class PublishGate {
public:
    std::shared_lock<std::shared_mutex> read() const {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    std::unique_lock<std::shared_mutex> publish() {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

private:
    mutable std::shared_mutex mutex_;
};

} // namespace ledger::application
