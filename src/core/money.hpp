/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Fixed-point money. Every figure in the ledger is an integer count of
 * micro-units so no binary floating point ever touches an amount.
 * ============================================================================
 */

#ifndef PPL_MONEY_HPP
#define PPL_MONEY_HPP

#include <cstdint>
#include <string>

namespace ppl {

    // money_micro: 1.00 = 1,000,000.
    typedef int64_t money_micro;

    // Monthly interest rate in parts per million (2% per month = 20,000).
    typedef int64_t rate_ppm;

    const money_micro kMicrosPerUnit = 1000000;
    const money_micro kMicrosPerCent = 10000;

    /**
     * @brief The one tolerance used for every "is balanced" and "is settled"
     * comparison in the engine (0.01 currency units).
     */
    const money_micro kTolerance = 10000;

    // Largest single amount accepted anywhere: 10,000,000,000.00.
    const money_micro kMaxAmount = 10000000000LL * kMicrosPerUnit;

    bool within_tolerance(money_micro a, money_micro b);

    /**
     * @return true when what remains due is at most kTolerance.
     */
    bool settled(money_micro due, money_micro paid);

    bool is_whole_cents(money_micro amount);

    // Half away from zero.
    money_micro round_to_cents(money_micro amount);

    /**
     * @brief principal x rate for one month, rounded to whole cents.
     */
    money_micro apply_rate(money_micro principal, rate_ppm rate);

    // Throws LedgerError(InvalidAmount) beyond kMaxAmount.
    money_micro units(int64_t whole_units);

    /**
     * @brief a + b, throwing LedgerError(InvalidAmount) instead of overflowing.
     */
    money_micro checked_add(money_micro a, money_micro b);

    /**
     * @brief Parses "1234.56", "-12", "0.5". At most six fractional digits
     * and no more than kMaxAmount either way. Throws
     * LedgerError(InvalidAmount) on anything else.
     */
    money_micro parse_money(const std::string& text);

    // Two decimals, no currency symbol: "91800.00", "-0.02".
    std::string format_money(money_micro amount);

    /**
     * @brief Converts a percent string ("2", "1.75") to a monthly ppm rate.
     */
    rate_ppm parse_rate_percent(const std::string& text);

    std::string format_rate_percent(rate_ppm rate);

} // namespace ppl

#endif // PPL_MONEY_HPP
