/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include "errors.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cctype>
#include <limits>

namespace ppl {

bool within_tolerance(money_micro a, money_micro b) {
    money_micro diff = a - b;
    if (diff < 0) diff = -diff;
    return diff < kTolerance;
}

bool settled(money_micro due, money_micro paid) {
    return due - paid <= kTolerance;
}

bool is_whole_cents(money_micro amount) {
    return amount % kMicrosPerCent == 0;
}

money_micro round_to_cents(money_micro amount) {
    money_micro whole = amount / kMicrosPerCent;
    money_micro rest = amount % kMicrosPerCent;
    if (rest * 2 >= kMicrosPerCent) whole += 1;
    else if (rest * 2 <= -kMicrosPerCent) whole -= 1;
    return whole * kMicrosPerCent;
}

money_micro apply_rate(money_micro principal, rate_ppm rate) {
    using boost::multiprecision::int128_t;

    int128_t product = int128_t(principal) * int128_t(rate);
    int128_t micros = product / 1000000;
    int128_t rest = product % 1000000;
    // Carry the sub-micro remainder so the cent rounding sees it.
    if (rest * 2 >= 1000000) micros += 1;
    else if (rest * 2 <= -1000000) micros -= 1;

    if (micros > int128_t(std::numeric_limits<money_micro>::max()) ||
        micros < int128_t(std::numeric_limits<money_micro>::min())) {
        throw validation_error("InvalidAmount", "Interest amount out of range.");
    }
    return round_to_cents(static_cast<money_micro>(micros));
}

money_micro units(int64_t whole_units) {
    const int64_t limit = kMaxAmount / kMicrosPerUnit;
    if (whole_units > limit || whole_units < -limit) {
        throw validation_error("InvalidAmount", "Amount " + std::to_string(whole_units) + " out of range.");
    }
    return whole_units * kMicrosPerUnit;
}

money_micro checked_add(money_micro a, money_micro b) {
    using boost::multiprecision::int128_t;

    int128_t sum = int128_t(a) + int128_t(b);
    if (sum > int128_t(std::numeric_limits<money_micro>::max()) ||
        sum < int128_t(std::numeric_limits<money_micro>::min())) {
        throw validation_error("InvalidAmount", "Amount total out of range.");
    }
    return static_cast<money_micro>(sum);
}

money_micro parse_money(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        pos++;
    }

    std::string whole;
    std::string fraction;
    bool seen_point = false;

    for (; pos < text.size(); pos++) {
        char c = text[pos];
        if (c == '.' && !seen_point) {
            seen_point = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            (seen_point ? fraction : whole) += c;
        } else {
            throw validation_error("InvalidAmount", "Not a decimal amount: '" + text + "'");
        }
    }

    if (whole.empty() && fraction.empty()) {
        throw validation_error("InvalidAmount", "Not a decimal amount: '" + text + "'");
    }
    if (fraction.size() > 6) {
        throw validation_error("InvalidAmount", "More than six decimal places: '" + text + "'");
    }
    if (whole.size() > 12) {
        throw validation_error("InvalidAmount", "Amount out of range: '" + text + "'");
    }

    money_micro result = whole.empty() ? 0 : std::stoll(whole) * kMicrosPerUnit;
    if (!fraction.empty()) {
        fraction.append(6 - fraction.size(), '0');
        result += std::stoll(fraction);
    }
    if (result > kMaxAmount) {
        throw validation_error("InvalidAmount", "Amount out of range: '" + text + "'");
    }
    return negative ? -result : result;
}

std::string format_money(money_micro amount) {
    money_micro cents = round_to_cents(amount) / kMicrosPerCent;
    bool negative = cents < 0;
    if (negative) cents = -cents;

    money_micro whole = cents / 100;
    money_micro part = cents % 100;
    return std::string(negative ? "-" : "") + std::to_string(whole) + "." + (part < 10 ? "0" : "") + std::to_string(part);
}

rate_ppm parse_rate_percent(const std::string& text) {
    money_micro percent = parse_money(text);
    if (percent < 0) {
        throw validation_error("InvalidArgument", "Interest rate cannot be negative: '" + text + "'");
    }
    return percent / 100;
}

std::string format_rate_percent(rate_ppm rate) {
    std::string whole = std::to_string(rate / 10000);
    rate_ppm rest = rate % 10000;
    if (rest == 0) return whole;

    std::string fraction = std::to_string(rest);
    fraction.insert(0, 4 - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
    return whole + "." + fraction;
}

} // namespace ppl
