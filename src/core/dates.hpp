/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dates.hpp
 * ============================================================================
 */

#ifndef PPL_DATES_HPP
#define PPL_DATES_HPP

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace ppl {

    typedef boost::gregorian::date date;

    /**
     * @brief Moves d by n calendar months. The day is clipped to the last day
     * of the target month (31 Jan + 1 month = 28/29 Feb).
     */
    date add_months(const date& d, int n);

    /**
     * @brief Largest k >= 0 such that add_months(from, k) <= to.
     */
    int completed_months(const date& from, const date& to);

    // ISO "YYYY-MM-DD". Throws LedgerError(InvalidArgument).
    date parse_date(const std::string& text);
    std::string format_date(const date& d);

    date today();

    /**
     * @brief One fiscal year of a company, [start, end] inclusive.
     * Not stored as a row; derived from the company's fiscal start.
     */
    struct FinancialYear {
        date start;
        date end;

        // "2024-25", or "2024" for a calendar-year company.
        std::string label() const;

        bool contains(const date& d) const;
        FinancialYear previous() const;
        FinancialYear next() const;

        static FinancialYear starting(int year, int start_month = 4, int start_day = 1);
        static FinancialYear containing(const date& d, int start_month = 4, int start_day = 1);

        /**
         * @brief Accepts "2024-25" or "2024". Throws LedgerError(InvalidArgument).
         */
        static FinancialYear from_label(const std::string& label, int start_month = 4, int start_day = 1);
    };

} // namespace ppl

#endif // PPL_DATES_HPP
