#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file Errors.hpp
 * @brief Исключения ядра учёта
 *
 * Все ошибки сообщаются вызывающему синхронно и не глотаются.
 * Код ошибки стабилен и пригоден для маппинга в ответ API верхнего уровня.
 */

namespace ledger::domain {

/**
 * @brief Базовое исключение ядра учёта
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Некорректный ввод: неположительное количество, пустые строки проводки,
 *        неизвестное значение перечисления
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError("VALIDATION_ERROR", message) {}
};

/**
 * @brief Реестр партий запретил движение по партии
 */
class LotUnusableError : public LedgerError {
public:
    explicit LotUnusableError(const std::string& lotId)
        : LedgerError("LOT_UNUSABLE", "Lot is not usable for stock movements: " + lotId)
        , lotId_(lotId) {}

    const std::string& lotId() const { return lotId_; }

private:
    std::string lotId_;
};

/**
 * @brief Расход увёл бы остаток в минус
 */
class InsufficientStockError : public LedgerError {
public:
    InsufficientStockError(int64_t balance, int64_t requested)
        : LedgerError("INSUFFICIENT_STOCK",
                      "Insufficient stock: balance=" + std::to_string(balance) +
                      ", requested=" + std::to_string(requested))
        , balance_(balance)
        , requested_(requested) {}

    int64_t balance() const { return balance_; }
    int64_t requested() const { return requested_; }

private:
    int64_t balance_;
    int64_t requested_;
};

/**
 * @brief Сумма дебета не равна сумме кредита
 */
class UnbalancedEntryError : public LedgerError {
public:
    UnbalancedEntryError(const std::string& debitTotal, const std::string& creditTotal)
        : LedgerError("UNBALANCED_ENTRY",
                      "Journal entry is unbalanced: debit=" + debitTotal +
                      ", credit=" + creditTotal)
        , debitTotal_(debitTotal)
        , creditTotal_(creditTotal) {}

    const std::string& debitTotal() const { return debitTotal_; }
    const std::string& creditTotal() const { return creditTotal_; }

private:
    std::string debitTotal_;
    std::string creditTotal_;
};

/**
 * @brief Попытка изменить сохранённое движение или проведённую запись журнала
 */
class ImmutableRecordViolation : public LedgerError {
public:
    explicit ImmutableRecordViolation(const std::string& message)
        : LedgerError("IMMUTABLE_RECORD", message) {}
};

/**
 * @brief Не удалось войти в критическую секцию за отведённое время
 */
class ConcurrencyConflict : public LedgerError {
public:
    explicit ConcurrencyConflict(const std::string& message)
        : LedgerError("CONCURRENCY_CONFLICT", message) {}
};

class ResourceNotFoundError : public LedgerError {
public:
    explicit ResourceNotFoundError(const std::string& message)
        : LedgerError("RESOURCE_NOT_FOUND", message) {}
};

} // namespace ledger::domain
