#pragma once

#include <string>
#include <cstdint>
#include <cctype>
#include <stdexcept>
#include <limits>

namespace accounting::domain {

/**
 * @brief Денежная сумма в минорных единицах (центах)
 *
 * Хранит целое число сотых долей валюты. Десятичная строка появляется
 * только на границе представления: parse() при импорте, toString()
 * при выводе. Вся арифметика в ядре целочисленная.
 */
class Money {
public:
    static constexpr int64_t kScale = 100;   ///< минорных единиц в одной целой

    Money() = default;

    static Money fromMinor(int64_t minor) {
        Money m;
        m.minor_ = minor;
        return m;
    }

    /**
     * @brief Сумма из целой и дробной частей: fromUnits(12, 50) == 12.50
     */
    static Money fromUnits(int64_t units, int64_t cents = 0) {
        return fromMinor(units * kScale + (units < 0 ? -cents : cents));
    }

    /**
     * @brief Разобрать десятичную строку ("1,234.56", "-0.5", "100")
     *
     * Разделители тысяч допускаются, дробь длиннее двух знаков
     * округляется до цента (половина от нуля).
     * @throws std::invalid_argument при неверном формате
     */
    static Money parse(const std::string& text) {
        size_t pos = 0;
        size_t end = text.size();
        while (pos < end && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

        if (pos == end) {
            throw std::invalid_argument("Empty money value");
        }

        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t units = 0;
        int64_t cents = 0;
        int fractionDigits = 0;
        bool roundUp = false;
        bool seenDigit = false;
        bool inFraction = false;

        for (; pos < end; ++pos) {
            char c = text[pos];
            if (c == ',' && !inFraction) {
                continue;
            }
            if (c == '.' && !inFraction) {
                inFraction = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid money value: " + text);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!inFraction) {
                if (units > (std::numeric_limits<int64_t>::max() / kScale - digit) / 10) {
                    throw std::invalid_argument("Money value out of range: " + text);
                }
                units = units * 10 + digit;
            } else if (fractionDigits < 2) {
                cents = cents * 10 + digit;
                ++fractionDigits;
            } else if (fractionDigits == 2) {
                roundUp = digit >= 5;
                ++fractionDigits;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid money value: " + text);
        }

        if (fractionDigits == 1) {
            cents *= 10;
        }

        int64_t minor = units * kScale + cents + (roundUp ? 1 : 0);
        return fromMinor(negative ? -minor : minor);
    }

    int64_t minor() const { return minor_; }

    bool isZero() const { return minor_ == 0; }
    bool isNegative() const { return minor_ < 0; }
    bool isPositive() const { return minor_ > 0; }

    Money abs() const { return fromMinor(minor_ < 0 ? -minor_ : minor_); }

    /**
     * @brief Десятичная строка с двумя знаками: "-1234.50"
     */
    std::string toString() const {
        int64_t value = minor_ < 0 ? -minor_ : minor_;
        std::string fraction = std::to_string(value % kScale);
        if (fraction.size() < 2) {
            fraction.insert(0, 2 - fraction.size(), '0');
        }
        return (minor_ < 0 ? "-" : "") + std::to_string(value / kScale) + "." + fraction;
    }

    /**
     * @brief Только для вывода в JSON/отчёты
     */
    double toDouble() const {
        return static_cast<double>(minor_) / static_cast<double>(kScale);
    }

    Money operator+(const Money& other) const { return fromMinor(minor_ + other.minor_); }
    Money operator-(const Money& other) const { return fromMinor(minor_ - other.minor_); }
    Money operator-() const { return fromMinor(-minor_); }

    Money& operator+=(const Money& other) {
        minor_ += other.minor_;
        return *this;
    }

    Money& operator-=(const Money& other) {
        minor_ -= other.minor_;
        return *this;
    }

    bool operator==(const Money& other) const { return minor_ == other.minor_; }
    bool operator!=(const Money& other) const { return minor_ != other.minor_; }
    bool operator<(const Money& other) const { return minor_ < other.minor_; }
    bool operator>(const Money& other) const { return minor_ > other.minor_; }
    bool operator<=(const Money& other) const { return minor_ <= other.minor_; }
    bool operator>=(const Money& other) const { return minor_ >= other.minor_; }

private:
    int64_t minor_ = 0;
};

} // namespace accounting::domain
