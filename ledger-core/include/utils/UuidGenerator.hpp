#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace ledger::utils {

/**
 * @brief Генератор идентификаторов записей учёта
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);
        return ss.str();
    }

    /**
     * @brief ID с префиксом типа записи: "mov-<uuid>", "je-<uuid>"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        return prefix + "-" + generate();
    }
};

} // namespace ledger::utils
