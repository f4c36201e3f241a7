// Copyright (c) Created by MWAC-dev on 2026.
// core/src/numeric.cpp
#include "nls/numeric.hpp"

#include <cmath>
#include <cstdio>
#include <limits>

namespace nls {

namespace {

constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

bool mul(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a != 0 && b > kMax / a) return false;
    out = a * b;
    return true;
}

bool add(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (b > kMax - a) return false;
    out = a + b;
    return true;
}

bool pow10(int exponent, std::uint64_t& out) {
    if (exponent < 0 || exponent > 19) return false;
    out = 1;
    for (int i = 0; i < exponent; ++i) out *= 10;
    return true;
}

bool is_separator(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',' || c == ';';
}

std::string format_fixed(std::uint64_t magnitude, int decimals, bool negative, bool plus) {
    std::string digits = std::to_string(magnitude);
    if (decimals > 0) {
        const auto width = static_cast<std::size_t>(decimals);
        if (digits.size() <= width) digits.insert(0, width + 1 - digits.size(), '0');
        digits.insert(digits.size() - width, ".");
    }
    if (negative && magnitude != 0) return "-" + digits;
    if (plus) return "+" + digits;
    return digits;
}

// Only reached for values that overflow the exact path.
std::string scale_wide(const Decimal& value, std::int64_t numerator, std::int64_t denominator, int decimals) {
    long double v = value.approx;
    if (!value.wide) v = static_cast<long double>(value.mantissa) / std::pow(10.0L, value.decimals);
    v = v * static_cast<long double>(numerator) / static_cast<long double>(denominator);

    const long double scaled = std::floor(v * std::pow(10.0L, decimals) + 0.5L);
    if (scaled < 1.8e19L) {
        return format_fixed(static_cast<std::uint64_t>(scaled), decimals, value.negative, value.explicit_plus);
    }
    const int length = std::snprintf(nullptr, 0, "%.*Lf", decimals, v);
    std::string out(length > 0 ? static_cast<std::size_t>(length) : 0, '\0');
    std::snprintf(out.data(), out.size() + 1, "%.*Lf", decimals, v);
    if (value.negative) return "-" + out;
    if (value.explicit_plus) return "+" + out;
    return out;
}

} // namespace

bool ParseDecimal(std::string_view token, Decimal& out) {
    out = Decimal{};
    std::size_t i = 0;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) {
        out.negative = token[i] == '-';
        out.explicit_plus = token[i] == '+';
        ++i;
    }

    std::size_t digits = 0;
    bool seen_point = false;
    std::size_t fraction_digits = 0;
    for (; i < token.size(); ++i) {
        const char c = token[i];
        if (c == '.') {
            if (seen_point) return false;
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        const auto d = static_cast<std::uint64_t>(c - '0');
        ++digits;
        if (seen_point) ++fraction_digits;
        out.approx = out.approx * 10.0L + static_cast<long double>(d);
        if (!out.wide) {
            std::uint64_t next;
            if (!mul(out.mantissa, 10, next) || !add(next, d, next)) out.wide = true;
            else out.mantissa = next;
        }
    }
    if (digits == 0) return false;
    if (seen_point && fraction_digits == 0) return false;

    out.decimals = static_cast<int>(fraction_digits);
    out.approx /= std::pow(10.0L, out.decimals);
    return true;
}

std::string ScaleDecimal(const Decimal& value, std::int64_t numerator, std::int64_t denominator, int decimals) {
    const int out_decimals = decimals >= 0 ? decimals : value.decimals;
    if (numerator <= 0 || denominator <= 0) return scale_wide(value, numerator, denominator, out_decimals);

    if (!value.wide) {
        std::uint64_t n = value.mantissa;
        std::uint64_t q = static_cast<std::uint64_t>(denominator);
        std::uint64_t p;
        bool ok = mul(n, static_cast<std::uint64_t>(numerator), n);
        if (out_decimals > value.decimals) {
            ok = ok && pow10(out_decimals - value.decimals, p) && mul(n, p, n);
        } else if (value.decimals > out_decimals) {
            ok = ok && pow10(value.decimals - out_decimals, p) && mul(q, p, q);
        }
        // round half away from zero on the magnitude: floor((2n + q) / 2q)
        std::uint64_t n2, q2;
        ok = ok && mul(n, 2, n2) && add(n2, q, n2) && mul(q, 2, q2);
        if (ok) return format_fixed(n2 / q2, out_decimals, value.negative, value.explicit_plus);
    }
    return scale_wide(value, numerator, denominator, out_decimals);
}

bool ScaleNumericText(std::string_view text, std::int64_t numerator, std::int64_t denominator,
                      int decimals, std::string& out, std::string& badToken) {
    out.clear();
    const bool identity = numerator == denominator;
    std::size_t i = 0;
    while (i < text.size()) {
        if (is_separator(text[i])) {
            out += text[i++];
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && !is_separator(text[j])) ++j;
        const std::string_view token = text.substr(i, j - i);
        Decimal d;
        if (!ParseDecimal(token, d)) {
            badToken = std::string(token);
            return false;
        }
        if (identity) out += token;
        else out += ScaleDecimal(d, numerator, denominator, decimals);
        i = j;
    }
    return true;
}

} // namespace nls
