#include "domain/Money.hpp"

#include <stdexcept>

namespace ledger::domain {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

Money Money::fromString(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty money value");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t units = 0;
    size_t intDigits = 0;
    while (pos < text.size() && isDigit(text[pos])) {
        units = units * 10 + (text[pos] - '0');
        if (units > MAX_MINOR / MINOR_PER_UNIT) {
            throw std::overflow_error("Money out of range: " + text);
        }
        ++pos;
        ++intDigits;
    }

    int64_t fraction = 0;
    size_t fracDigits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && isDigit(text[pos])) {
            if (fracDigits == 2) {
                throw std::invalid_argument("Money supports at most 2 decimal places: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++pos;
            ++fracDigits;
        }
        if (fracDigits == 0) {
            throw std::invalid_argument("Invalid money value: " + text);
        }
    }

    if (pos != text.size() || (intDigits == 0 && fracDigits == 0)) {
        throw std::invalid_argument("Invalid money value: " + text);
    }

    if (fracDigits == 1) {
        fraction *= 10;
    }

    int64_t minor = units * MINOR_PER_UNIT + fraction;
    return Money(negative ? -minor : minor);
}

std::string Money::toString() const {
    int64_t magnitude = minor_ < 0 ? -minor_ : minor_;

    std::string fraction = std::to_string(magnitude % MINOR_PER_UNIT);
    if (fraction.size() < 2) {
        fraction.insert(0, "0");
    }

    return (minor_ < 0 ? "-" : "") + std::to_string(magnitude / MINOR_PER_UNIT) + "." + fraction;
}

// Оба операнда в пределах MAX_MINOR, сумма в int64_t не переполняется
Money Money::operator+(const Money& other) const {
    return fromMinor(minor_ + other.minor_);
}

Money Money::operator-(const Money& other) const {
    return fromMinor(minor_ - other.minor_);
}

Money Money::operator-() const {
    return Money(-minor_);
}

} // namespace ledger::domain
