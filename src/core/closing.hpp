/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: closing.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Financial year close and open. Closing zeroes every Income and Expense
 * account for the year into Retained Earnings; opening carries Asset,
 * Liability and Equity balances into the new year. Both are gated by the
 * literal confirmation token "CONFIRM" and run inside one serializable
 * transaction that first locks out every posting, then holds the company
 * row.
 * ============================================================================
 */

#ifndef PPL_CLOSING_HPP
#define PPL_CLOSING_HPP

#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>

#include "balances.hpp"
#include "config.hpp"
#include "model.hpp"

namespace ppl {

    extern const char* const kConfirmationToken;

    // Throws LedgerError(ConfirmationRequired) unless token is exactly "CONFIRM".
    void require_confirmation(const std::string& token);

    struct YearState {
        bool closed = false;
        bool opened = false;
        bool has_closing_voucher = false;
    };

    /**
     * check_closable
     * AlreadyClosed when the year is recorded closed or already carries a
     * closing voucher; YearNotEnded while its last day is after today.
     */
    void check_closable(const FinancialYear& year, const YearState& state, const date& today);

    // PriorYearNotClosed unless the previous year is closed, then AlreadyOpened.
    void check_openable(const FinancialYear& year, const YearState& prior, const YearState& state);

    struct ClosingPlan {
        std::vector<EntryDraft> entries;
        money_micro total_revenue = 0;
        money_micro total_expenses = 0;
        money_micro net_profit = 0;
    };

    /**
     * build_closing_entries
     * Income accounts are debited by their credit balance for the year and
     * Expense accounts credited by their debit balance (the other way round
     * for a contra balance). Net profit is credited to Retained Earnings, a
     * net loss debited.
     */
    ClosingPlan build_closing_entries(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                                      const FinancialYear& year, int64_t retained_earnings_id);

    struct OpeningPlan {
        std::vector<EntryDraft> entries;
        money_micro total_debit = 0;
        money_micro total_credit = 0;
    };

    /**
     * build_opening_entries
     * One line per Asset, Liability and Equity account with a non-zero
     * balance at prior_end, on its natural side. Earnings never closed are
     * folded into Retained Earnings. Throws LedgerError(InternalInvariant)
     * when the set does not balance.
     */
    OpeningPlan build_opening_entries(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                                      const date& prior_end, int64_t retained_earnings_id);

    struct YearEndResult {
        std::string financial_year;
        date start;
        date end;
        std::optional<Voucher> voucher;     // none when there was nothing to carry
        money_micro net_profit = 0;
    };

    class PeriodClosingEngine {
    public:
        explicit PeriodClosingEngine(const AccountCodes& codes) : codes_(codes) {}

        /**
         * close_year
         * Fails with AlreadyClosed, YearNotEnded (end after today) or
         * PendingUnpostedVouchers. The unposted check runs again right
         * before returning to the caller's commit.
         */
        YearEndResult close_year(pqxx::transaction_base& tx, int64_t company_id, const std::string& label,
                                 const std::string& actor, const std::string& confirmation, const date& today);

        /**
         * open_year
         * Fails with PriorYearNotClosed or AlreadyOpened.
         */
        YearEndResult open_year(pqxx::transaction_base& tx, int64_t company_id, const std::string& label,
                                const std::string& actor, const std::string& confirmation);

    private:
        AccountCodes codes_;
    };

} // namespace ppl

#endif // PPL_CLOSING_HPP
