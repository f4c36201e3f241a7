//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nls {

    // A decimal token as written in the source: value == mantissa / 10^decimals.
    struct Decimal {
        bool negative{false};
        bool explicit_plus{false};
        std::uint64_t mantissa{0};
        int decimals{0};
        bool wide{false};        // mantissa did not fit 64 bits, only `approx` is valid
        long double approx{0};
    };

    // Accepts [+-]digits[.digits] and [+-].digits; no exponents.
    bool ParseDecimal(std::string_view token, Decimal& out);

    // value * numerator / denominator, rounded half away from zero to `decimals`
    // places (-1 keeps the token's own precision).
    std::string ScaleDecimal(const Decimal& value, std::int64_t numerator, std::int64_t denominator,
                             int decimals = -1);

    // Scales every numeric token of `text`; separators (whitespace , ;) stay verbatim.
    // A factor of 1 returns the tokens unchanged, whatever `decimals` says.
    // Returns false and sets badToken when a token is not a decimal number.
    bool ScaleNumericText(std::string_view text, std::int64_t numerator, std::int64_t denominator,
                          int decimals, std::string& out, std::string& badToken);
}
