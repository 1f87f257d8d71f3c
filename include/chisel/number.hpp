/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_NUMBER_HPP
#define CHISEL_NUMBER_HPP

#pragma once
#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>

#include "config.hpp"

namespace chisel {

    enum class NumberKind : std::uint8_t {
        Integer,
        Float
    };

    struct Number {
        NumberKind kind {NumberKind::Float};
        union {
            std::int64_t i;
            double d;
        };

        constexpr Number() noexcept: d(0.0) { }

        static constexpr Number from_i64(const std::int64_t v) noexcept {
            Number n;
            n.kind = NumberKind::Integer;
            n.i = v;
            return n;
        }

        static constexpr Number from_double(const double v) noexcept {
            Number n;
            n.kind = NumberKind::Float;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr bool is_integer() const noexcept {
            return kind == NumberKind::Integer;
        }

        [[nodiscard]] constexpr bool is_float() const noexcept {
            return kind == NumberKind::Float;
        }

        [[nodiscard]] constexpr std::int64_t as_i64() const noexcept {
            return kind == NumberKind::Integer ? i : static_cast<std::int64_t>(d);
        }

        [[nodiscard]] constexpr double as_double() const noexcept {
            return kind == NumberKind::Integer ? static_cast<double>(i) : d;
        }

        // Integer(1) and Float(1.0) are different values
        [[nodiscard]] friend constexpr bool operator==(const Number& a, const Number& b) noexcept {
            if (a.kind != b.kind)
                return false;
            return a.kind == NumberKind::Integer ? a.i == b.i : a.d == b.d;
        }
    };

    namespace detail {

        // Decimal exponent of the leading significant digit plus one: positive means
        // the magnitude is at least 1. Only called on validated lexemes.
        [[nodiscard]] inline long long decimal_magnitude(const std::string_view lexeme) noexcept {
            std::size_t i = lexeme.empty() || lexeme[0] != '-' ? 0 : 1;

            long long int_digits = 0;
            long long leading_zeros = 0;
            bool significant = false;

            for (; i < lexeme.size() && lexeme[i] >= '0' && lexeme[i] <= '9'; ++i) {
                if (lexeme[i] != '0')
                    significant = true;
                if (significant)
                    ++int_digits;
            }

            if (i < lexeme.size() && lexeme[i] == '.') {
                for (++i; i < lexeme.size() && lexeme[i] >= '0' && lexeme[i] <= '9'; ++i) {
                    if (!significant && lexeme[i] == '0')
                        ++leading_zeros;
                    else
                        significant = true;
                }
            }

            constexpr long long kExpCap = 1'000'000;
            long long exp = 0;
            bool exp_neg = false;
            if (i < lexeme.size() && (lexeme[i] == 'e' || lexeme[i] == 'E')) {
                ++i;
                if (i < lexeme.size() && (lexeme[i] == '+' || lexeme[i] == '-'))
                    exp_neg = lexeme[i++] == '-';
                for (; i < lexeme.size(); ++i) {
                    if (exp < kExpCap)
                        exp = exp * 10 + (lexeme[i] - '0');
                }
            }
            if (exp_neg)
                exp = -exp;

            return int_digits ? exp + int_digits : exp - leading_zeros;
        }

        [[nodiscard]] inline double lexeme_to_double(const std::string_view lexeme) noexcept {
            double v {};
            const auto [p, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), v);
            if (ec != std::errc::result_out_of_range)
                return v;

            // from_chars leaves v untouched when out of range: saturate to infinity
            // or flush to a signed zero
            const bool neg = !lexeme.empty() && lexeme[0] == '-';
            if (decimal_magnitude(lexeme) > 0)
                return neg ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
            return neg ? -0.0 : 0.0;
        }

    } // namespace detail

    // Classifies an already validated JSON number lexeme. Integral lexemes that fit
    // int64 stay exact, everything else widens to double.
    [[nodiscard]] inline Number resolve_number(const std::string_view lexeme, const NumericMode mode = NumericMode::Mixed) {
        if (mode == NumericMode::FloatOnly || lexeme.empty())
            return Number::from_double(detail::lexeme_to_double(lexeme));

        const char* p = lexeme.data();
        const char* const end = p + lexeme.size();

        auto neg = false;
        if (*p == '-') {
            neg = true;
            ++p;
        }

        constexpr auto max_pos = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        constexpr std::uint64_t max_neg = max_pos + 1ull;

        const std::uint64_t limit = neg ? max_neg : max_pos;
        const std::uint64_t cutoff = limit / 10;
        const auto cutlim = static_cast<unsigned>(limit % 10);

        std::uint64_t val = 0;
        while (p < end) {
            const auto digit = static_cast<unsigned>(*p - '0');
            if (digit > 9)
                return Number::from_double(detail::lexeme_to_double(lexeme)); // fraction or exponent

            if (val > cutoff || (val == cutoff && digit > cutlim))
                return Number::from_double(detail::lexeme_to_double(lexeme));

            val = val * 10 + digit;
            ++p;
        }

        if (neg)
            return Number::from_i64(val == max_neg ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(val));
        return Number::from_i64(static_cast<std::int64_t>(val));
    }

} // namespace chisel

#endif // CHISEL_NUMBER_HPP
