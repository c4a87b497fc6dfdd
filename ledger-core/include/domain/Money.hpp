#pragma once

#include "domain/Errors.hpp"
#include <string>
#include <cstdint>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Точная денежная сумма с валютой
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9), как в
 * протоколах брокеров. Вся арифметика целочисленная, без double.
 * Отрицательные значения нормализованы так, что nano всегда в [0, 10^9).
 */
class Money {
public:
    static constexpr int32_t NANO = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть, 10^-9
    std::string currency = "BIF";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "BIF")
        : units(u), nano(n), currency(cur) {
        normalize();
    }

    static Money zero(const std::string& cur = "BIF") {
        return Money(0, 0, cur);
    }

    /**
     * @brief Разбор десятичной строки вида "-12.50"
     * @throws ValidationError при неверном формате
     */
    static Money fromString(const std::string& str, const std::string& cur = "BIF") {
        if (str.empty()) {
            throw ValidationError("Empty money amount");
        }
        bool negative = str[0] == '-';
        std::string body = negative ? str.substr(1) : str;
        auto dot = body.find('.');
        std::string whole = body.substr(0, dot);
        std::string frac = dot == std::string::npos ? "" : body.substr(dot + 1);

        if (whole.empty() || frac.size() > 9 ||
            whole.find_first_not_of("0123456789") != std::string::npos ||
            frac.find_first_not_of("0123456789") != std::string::npos) {
            throw ValidationError("Invalid money amount: " + str);
        }
        frac.append(9 - frac.size(), '0');

        int64_t wholeUnits = 0;
        try {
            wholeUnits = std::stoll(whole);
        } catch (const std::out_of_range&) {
            throw ValidationError("Money amount out of range: " + str);
        }
        Money m(wholeUnits, static_cast<int32_t>(std::stol(frac)), cur);
        return negative ? -m : m;
    }

    /**
     * @brief Десятичное представление, минимум два знака после точки
     */
    std::string toString() const {
        if (isNegative()) {
            return "-" + (-*this).toString();
        }
        std::string frac = std::to_string(nano);
        frac.insert(0, 9 - frac.size(), '0');
        while (frac.size() > 2 && frac.back() == '0') {
            frac.pop_back();
        }
        return std::to_string(units) + "." + frac;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isNegative() const { return units < 0; }
    bool isPositive() const { return !isZero() && !isNegative(); }

    Money operator-() const {
        Money result;
        result.currency = currency;
        if (nano == 0) {
            result.units = -units;
        } else {
            result.units = -units - 1;
            result.nano = NANO - nano;
        }
        return result;
    }

    Money operator+(const Money& other) const {
        Money result;
        result.currency = currency;
        if (__builtin_add_overflow(units, other.units, &result.units)) {
            throw ValidationError("Money amount out of range");
        }
        result.nano = nano + other.nano;
        result.normalize();
        return result;
    }

    Money operator-(const Money& other) const {
        return *this + (-other);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    /**
     * @throws ValidationError если произведение не помещается в units
     */
    Money operator*(int64_t multiplier) const {
        int64_t totalNano = 0;
        int64_t wholeUnits = 0;
        Money result;
        result.currency = currency;
        if (__builtin_mul_overflow(static_cast<int64_t>(nano), multiplier, &totalNano) ||
            __builtin_mul_overflow(units, multiplier, &wholeUnits) ||
            __builtin_add_overflow(wholeUnits, totalNano / NANO, &result.units)) {
            throw ValidationError("Money amount out of range: " + toString() +
                                  " x " + std::to_string(multiplier));
        }
        result.nano = static_cast<int32_t>(totalNano % NANO);
        result.normalize();
        return result;
    }

    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void normalize() {
        units += nano / NANO;
        nano %= NANO;
        if (nano < 0) {
            units--;
            nano += NANO;
        }
    }
};

} // namespace ledger::domain
