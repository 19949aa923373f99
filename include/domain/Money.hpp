#pragma once

#include "errors/LedgerError.hpp"
#include <string>
#include <cstdint>
#include <cctype>

namespace penny::domain {

/**
 * @brief Точное десятичное денежное значение
 *
 * Хранит целую часть и дробную в нано-единицах (10^-9), как в
 * брокерских API. Знаки units и nano всегда совпадают.
 * Арифметика целочисленная: никаких double в балансах.
 */
class Money {
public:
    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)

    static constexpr int32_t NANO_FACTOR = 1000000000;

    Money() = default;

    Money(int64_t u, int32_t n) : units(u), nano(n) {
        normalize();
    }

    static Money zero() { return Money(); }

    /**
     * @brief Разобрать строку вида "-123.45"
     * @throws ValidationError если строка не является числом
     *         или содержит больше 9 знаков после точки
     */
    static Money parse(const std::string& text) {
        size_t pos = 0;
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

        size_t end = text.size();
        while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

        bool negative = false;
        if (pos < end && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t whole = 0;
        int32_t fraction = 0;
        int wholeDigits = 0;
        int fractionDigits = 0;

        while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (whole > (INT64_MAX - 9) / 10) {
                throw ValidationError("Amount is too large: " + text);
            }
            whole = whole * 10 + (text[pos] - '0');
            ++wholeDigits;
            ++pos;
        }

        if (pos < end && text[pos] == '.') {
            ++pos;
            while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (fractionDigits == 9) {
                    throw ValidationError("Too many decimal places: " + text);
                }
                fraction = fraction * 10 + (text[pos] - '0');
                ++fractionDigits;
                ++pos;
            }
        }

        if (pos != end || (wholeDigits == 0 && fractionDigits == 0)) {
            throw ValidationError("Invalid amount: '" + text + "'");
        }

        for (int i = fractionDigits; i < 9; ++i) {
            fraction *= 10;
        }

        return negative ? Money(-whole, -fraction) : Money(whole, fraction);
    }

    /**
     * @brief Проверить, что строка является корректной суммой
     */
    static bool isValid(const std::string& text) {
        try {
            parse(text);
            return true;
        } catch (const ValidationError&) {
            return false;
        }
    }

    /**
     * @brief Строковое представление, минимум 2 знака после точки
     *
     * "1000000.00", "-0.50", "12.345"
     */
    std::string toString() const {
        bool negative = units < 0 || nano < 0;
        uint64_t absUnits = units < 0 ? static_cast<uint64_t>(-(units + 1)) + 1 : static_cast<uint64_t>(units);
        int32_t absNano = nano < 0 ? -nano : nano;

        std::string digits = std::to_string(absNano);
        digits.insert(0, 9 - digits.size(), '0');
        while (digits.size() > 2 && digits.back() == '0') {
            digits.pop_back();
        }

        return (negative ? "-" : "") + std::to_string(absUnits) + "." + digits;
    }

    /// Только для отображения и процентов, не для балансов
    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / NANO_FACTOR;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isPositive() const { return units > 0 || nano > 0; }
    bool isNegative() const { return units < 0 || nano < 0; }

    Money abs() const {
        return isNegative() ? -*this : *this;
    }

    Money operator-() const {
        Money result;
        result.units = -units;
        result.nano = -nano;
        return result;
    }

    Money operator+(const Money& other) const {
        return Money(units + other.units, nano + other.nano);
    }

    Money operator-(const Money& other) const {
        return *this + (-other);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    bool operator<(const Money& other) const {
        if (units != other.units) return units < other.units;
        return nano < other.nano;
    }

    bool operator>(const Money& other) const { return other < *this; }
    bool operator<=(const Money& other) const { return !(other < *this); }
    bool operator>=(const Money& other) const { return !(*this < other); }

private:
    void normalize() {
        if (nano >= NANO_FACTOR) {
            units += nano / NANO_FACTOR;
            nano %= NANO_FACTOR;
        } else if (nano <= -NANO_FACTOR) {
            units -= (-nano) / NANO_FACTOR;
            nano = -((-nano) % NANO_FACTOR);
        }

        // Выравниваем знаки units и nano
        if (units > 0 && nano < 0) {
            units--;
            nano += NANO_FACTOR;
        } else if (units < 0 && nano > 0) {
            units++;
            nano -= NANO_FACTOR;
        }
    }
};

} // namespace penny::domain
