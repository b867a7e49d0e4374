#pragma once

#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Денежная сумма с фиксированной точкой
 *
 * Хранит значение в минорных единицах (копейки, центы) как int64_t.
 * Два знака после запятой и не более 10 знаков целой части, как колонка
 * NUMERIC(12,2) в БД: |value| <= 9999999999.99. Выход за диапазон
 * (разбор, сложение, вычитание) бросает std::overflow_error.
 * Никакого double в расчётах баланса.
 *
 * @example
 * ```cpp
 * auto price = Money::fromString("250.50");
 * auto rest = Money::fromString("500") - price;   // 249.50
 * rest.toString();                                 // "249.50"
 * ```
 */
class Money {
public:
    static constexpr int64_t MINOR_PER_UNIT = 100;
    static constexpr int64_t MAX_MINOR = 999'999'999'999;

    Money() = default;

    /// @throws std::overflow_error если |minor| > MAX_MINOR
    static Money fromMinor(int64_t minor) {
        if (minor > MAX_MINOR || minor < -MAX_MINOR) {
            throw std::overflow_error("Money out of range: " + std::to_string(minor) + " minor units");
        }
        return Money(minor);
    }

    static Money max() { return Money(MAX_MINOR); }

    /**
     * @brief Разобрать десятичную строку ("12", "12.5", "-0.05")
     * @throws std::invalid_argument при неверном формате или > 2 знаков дробной части
     * @throws std::overflow_error если значение вне диапазона NUMERIC(12,2)
     */
    static Money fromString(const std::string& text);

    int64_t minor() const { return minor_; }

    std::string toString() const;

    bool isZero() const { return minor_ == 0; }
    bool isNegative() const { return minor_ < 0; }
    bool isPositive() const { return minor_ > 0; }

    /// @throws std::overflow_error
    Money operator+(const Money& other) const;
    /// @throws std::overflow_error
    Money operator-(const Money& other) const;
    Money operator-() const;

    Money& operator+=(const Money& other) { return *this = *this + other; }
    Money& operator-=(const Money& other) { return *this = *this - other; }

    auto operator<=>(const Money&) const = default;

private:
    explicit Money(int64_t minor) : minor_(minor) {}

    int64_t minor_ = 0;
};

} // namespace ledger::domain
