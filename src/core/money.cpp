/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include <limits>

namespace tally {

namespace {

const money_micro kMicrosPerUnit = 1000000;
const int kMaxFraction = 6;

} // namespace

std::optional<money_micro> parse_money(const std::string& text, char decimal_separator) {
    const char group_separator = decimal_separator == ',' ? '.' : ',';
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == '$' || c == ' ' || c == '\t' || c == '"') continue;
        s.push_back(c);
    }
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s.front() == '(' && s.back() == ')') {
        negative = true;
        s = s.substr(1, s.size() - 2);
    }
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        if (s.front() == '-') negative = !negative;
        s.erase(0, 1);
    }
    if (s.empty()) return std::nullopt;

    const money_micro max = std::numeric_limits<money_micro>::max();
    money_micro whole = 0;
    money_micro fraction = 0;
    int fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;
    bool grouped = false;
    int group_digits = 0; // digits since the last group separator

    for (char c : s) {
        if (c == decimal_separator) {
            if (seen_point) return std::nullopt;
            if (grouped && group_digits != 3) return std::nullopt;
            seen_point = true;
            continue;
        }
        if (c == group_separator) {
            // Groups follow 1-3 leading digits and hold exactly three digits each.
            if (seen_point || group_digits == 0) return std::nullopt;
            if (grouped ? group_digits != 3 : group_digits > 3) return std::nullopt;
            grouped = true;
            group_digits = 0;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;
        int digit = c - '0';
        if (seen_point) {
            if (++fraction_digits > kMaxFraction) return std::nullopt;
            fraction = fraction * 10 + digit;
        } else {
            group_digits++;
            if (whole > (max / kMicrosPerUnit - digit) / 10) {
                return std::nullopt;
            }
            whole = whole * 10 + digit;
        }
    }
    if (!seen_digit) return std::nullopt;
    if (grouped && !seen_point && group_digits != 3) return std::nullopt;

    for (int i = fraction_digits; i < kMaxFraction; ++i) fraction *= 10;
    if (whole == max / kMicrosPerUnit && fraction > max % kMicrosPerUnit) return std::nullopt;
    money_micro micros = whole * kMicrosPerUnit + fraction;
    return negative ? -micros : micros;
}

std::string format_money(money_micro micros) {
    bool negative = micros < 0;
    // Magnitude as unsigned so INT64_MIN does not overflow.
    unsigned long long magnitude = negative
        ? static_cast<unsigned long long>(-(micros + 1)) + 1
        : static_cast<unsigned long long>(micros);

    unsigned long long whole = magnitude / kMicrosPerUnit;
    std::string frac = std::to_string(magnitude % kMicrosPerUnit);
    frac.insert(0, kMaxFraction - frac.size(), '0');
    while (frac.size() > 2 && frac.back() == '0') frac.pop_back();

    return (negative ? "-" : "") + std::to_string(whole) + "." + frac;
}

} // namespace tally
