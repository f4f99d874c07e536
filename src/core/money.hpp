#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apwatch {

/// Currency amount held in the smallest currency unit (cents)
/// Grouping and divisibility checks stay exact integer operations
class Money {
public:
    using underlying_type = std::int64_t;

    static constexpr int kDecimals = 2;
    static constexpr underlying_type kCentsPerUnit = 100;

    constexpr Money() noexcept = default;

    [[nodiscard]] static constexpr Money from_cents(underlying_type cents) noexcept {
        Money m;
        m.cents_ = cents;
        return m;
    }

    [[nodiscard]] static constexpr Money from_units(underlying_type units) noexcept {
        return from_cents(units * kCentsPerUnit);
    }

    /// Round a double amount to the nearest cent
    [[nodiscard]] static Money from_double(double amount) noexcept {
        return from_cents(static_cast<underlying_type>(
            std::llround(amount * static_cast<double>(kCentsPerUnit))));
    }

    /// Parse a decimal string such as "1500", "999.99" or "-12.5"
    /// Digits beyond the second decimal are truncated
    /// @throws std::invalid_argument for invalid format
    /// @throws std::overflow_error if value is too large
    [[nodiscard]] static Money parse(std::string_view str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        bool negative = false;
        std::size_t pos = 0;
        if (str[0] == '-' || str[0] == '+') {
            negative = str[0] == '-';
            pos = 1;
        }
        if (pos >= str.size()) {
            throw std::invalid_argument("Invalid amount format: sign only");
        }

        constexpr underlying_type max_units =
            std::numeric_limits<underlying_type>::max() / kCentsPerUnit / 10;

        underlying_type units = 0;
        underlying_type frac = 0;
        int frac_digits = 0;
        bool in_fraction = false;
        bool has_digits = false;

        for (; pos < str.size(); ++pos) {
            char c = str[pos];
            if (c == '.') {
                if (in_fraction) {
                    throw std::invalid_argument("Multiple decimal points");
                }
                in_fraction = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid character in amount");
            }
            has_digits = true;
            int digit = c - '0';
            if (in_fraction) {
                if (frac_digits < kDecimals) {
                    frac = frac * 10 + digit;
                    ++frac_digits;
                }
            } else {
                if (units > max_units) {
                    throw std::overflow_error("Amount too large");
                }
                units = units * 10 + digit;
            }
        }

        if (!has_digits) {
            throw std::invalid_argument("No digits found in amount");
        }
        while (frac_digits < kDecimals) {
            frac *= 10;
            ++frac_digits;
        }

        underlying_type cents = units * kCentsPerUnit + frac;
        return from_cents(negative ? -cents : cents);
    }

    [[nodiscard]] constexpr underlying_type cents() const noexcept {
        return cents_;
    }

    /// For statistics and display only
    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(cents_) / static_cast<double>(kCentsPerUnit);
    }

    /// Always two decimals, e.g. "1500.00"
    [[nodiscard]] std::string to_string() const {
        bool negative = cents_ < 0;
        underlying_type abs_cents = negative ? -cents_ : cents_;

        std::string frac = std::to_string(abs_cents % kCentsPerUnit);
        if (frac.size() < 2) {
            frac.insert(0, 1, '0');
        }

        std::string result = std::to_string(abs_cents / kCentsPerUnit) + "." + frac;
        return negative ? "-" + result : result;
    }

    /// True when the amount is an exact multiple of `units` whole currency units
    [[nodiscard]] constexpr bool is_multiple_of_units(underlying_type units) const noexcept {
        if (units <= 0) {
            return false;
        }
        return cents_ % (units * kCentsPerUnit) == 0;
    }

    [[nodiscard]] constexpr bool is_negative() const noexcept {
        return cents_ < 0;
    }

    [[nodiscard]] constexpr bool operator==(const Money& other) const noexcept {
        return cents_ == other.cents_;
    }

    [[nodiscard]] constexpr bool operator!=(const Money& other) const noexcept {
        return cents_ != other.cents_;
    }

    [[nodiscard]] constexpr bool operator<(const Money& other) const noexcept {
        return cents_ < other.cents_;
    }

    [[nodiscard]] constexpr bool operator<=(const Money& other) const noexcept {
        return cents_ <= other.cents_;
    }

    [[nodiscard]] constexpr bool operator>(const Money& other) const noexcept {
        return cents_ > other.cents_;
    }

    [[nodiscard]] constexpr bool operator>=(const Money& other) const noexcept {
        return cents_ >= other.cents_;
    }

    [[nodiscard]] constexpr Money operator+(const Money& other) const noexcept {
        return from_cents(cents_ + other.cents_);
    }

    [[nodiscard]] constexpr Money operator-(const Money& other) const noexcept {
        return from_cents(cents_ - other.cents_);
    }

    constexpr Money& operator+=(const Money& other) noexcept {
        cents_ += other.cents_;
        return *this;
    }

    [[nodiscard]] static constexpr Money zero() noexcept {
        return Money{};
    }

private:
    underlying_type cents_{0};
};

}  // namespace apwatch

namespace std {
template <>
struct hash<apwatch::Money> {
    std::size_t operator()(const apwatch::Money& m) const noexcept {
        return std::hash<apwatch::Money::underlying_type>{}(m.cents());
    }
};
}  // namespace std
