/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dates.cpp
 * ============================================================================
 */

#include "dates.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace ppl {

namespace {

date clipped(int year, int month, int day) {
    int last = boost::gregorian::gregorian_calendar::end_of_month_day(year, month);
    return date(year, month, std::min(day, last));
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

date add_months(const date& d, int n) {
    int total = static_cast<int>(d.year()) * 12 + (static_cast<int>(d.month()) - 1) + n;
    int year = total / 12;
    int month = total % 12;
    if (month < 0) {
        month += 12;
        year -= 1;
    }
    return clipped(year, month + 1, d.day());
}

int completed_months(const date& from, const date& to) {
    if (to < from) return 0;

    int k = (static_cast<int>(to.year()) - static_cast<int>(from.year())) * 12 +
            (static_cast<int>(to.month()) - static_cast<int>(from.month()));
    while (k > 0 && add_months(from, k) > to) k--;
    return std::max(k, 0);
}

date parse_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !all_digits(text.substr(0, 4)) || !all_digits(text.substr(5, 2)) || !all_digits(text.substr(8, 2))) {
        throw validation_error("InvalidArgument", "Expected a YYYY-MM-DD date, got '" + text + "'");
    }
    try {
        return boost::gregorian::from_simple_string(text);
    } catch (const std::exception&) {
        throw validation_error("InvalidArgument", "Not a calendar date: '" + text + "'");
    }
}

std::string format_date(const date& d) {
    return boost::gregorian::to_iso_extended_string(d);
}

date today() {
    return boost::gregorian::day_clock::local_day();
}

std::string FinancialYear::label() const {
    int first = static_cast<int>(start.year());
    if (start.month() == 1 && start.day() == 1) return std::to_string(first);

    int second = (first + 1) % 100;
    return std::to_string(first) + "-" + (second < 10 ? "0" : "") + std::to_string(second);
}

bool FinancialYear::contains(const date& d) const {
    return d >= start && d <= end;
}

FinancialYear FinancialYear::previous() const {
    return starting(static_cast<int>(start.year()) - 1, start.month(), start.day());
}

FinancialYear FinancialYear::next() const {
    return starting(static_cast<int>(start.year()) + 1, start.month(), start.day());
}

FinancialYear FinancialYear::starting(int year, int start_month, int start_day) {
    if (start_month < 1 || start_month > 12 || start_day < 1 || start_day > 31) {
        throw validation_error("InvalidArgument", "Invalid fiscal start month/day.");
    }
    FinancialYear fy;
    fy.start = clipped(year, start_month, start_day);
    fy.end = clipped(year + 1, start_month, start_day) - boost::gregorian::days(1);
    return fy;
}

FinancialYear FinancialYear::containing(const date& d, int start_month, int start_day) {
    int year = static_cast<int>(d.year());
    FinancialYear fy = starting(year, start_month, start_day);
    if (d < fy.start) return starting(year - 1, start_month, start_day);
    return fy;
}

FinancialYear FinancialYear::from_label(const std::string& label, int start_month, int start_day) {
    std::string head = label.substr(0, 4);
    if (!all_digits(head) || (label.size() != 4 && label.size() != 7)) {
        throw validation_error("InvalidArgument", "Invalid financial year label: '" + label + "'");
    }
    FinancialYear fy = starting(std::stoi(head), start_month, start_day);
    if (fy.label() != label) {
        throw validation_error("InvalidArgument", "Financial year label '" + label + "' does not match fiscal start " + fy.label());
    }
    return fy;
}

} // namespace ppl
