/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: balances.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Read-side aggregation over the entry log. Nothing here touches the
 * database: callers load EntryRows (ordered by voucher date, voucher id,
 * entry id) and every figure is derived from them on demand.
 * * Cumulative figures skip year_opening vouchers. The log already runs from
 * inception, so a carry-forward voucher would count every balance twice.
 * ============================================================================
 */

#ifndef PPL_BALANCES_HPP
#define PPL_BALANCES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "chart.hpp"
#include "dates.hpp"
#include "model.hpp"

namespace ppl {

    /**
     * @brief One ledger line joined with its voucher header.
     */
    struct EntryRow {
        int64_t entry_id = 0;
        int64_t voucher_id = 0;
        int64_t account_id = 0;
        VoucherType voucher_type = VoucherType::Journal;
        date voucher_date;
        Direction direction = Direction::Debit;
        money_micro amount = 0;
        std::string narration;
        std::string voucher_narration;
        std::optional<Reference> reference;

        money_micro debit_amount() const { return direction == Direction::Debit ? amount : 0; }
        money_micro credit_amount() const { return direction == Direction::Credit ? amount : 0; }
    };

    // (voucher date, voucher id, entry id)
    void sort_for_reporting(std::vector<EntryRow>& rows);

    /**
     * @brief Debit-minus-credit for Asset/Expense, credit-minus-debit otherwise.
     */
    money_micro normal_balance(AccountType type, money_micro debit, money_micro credit);

    money_micro account_balance(const Account& account, const std::vector<EntryRow>& rows, const date& as_of);

    struct TrialBalanceLine {
        int64_t account_id = 0;
        std::string code;
        std::string name;
        AccountType type = AccountType::Asset;
        bool active = true;
        money_micro debit = 0;
        money_micro credit = 0;
    };

    struct TrialBalance {
        date as_of;
        std::vector<TrialBalanceLine> lines;
        money_micro total_debit = 0;
        money_micro total_credit = 0;
        bool is_balanced = true;
    };

    /**
     * trial_balance
     * Every active account plus any inactive account still carrying a
     * balance, each on its debit or credit side.
     */
    TrialBalance trial_balance(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& as_of);

    struct DayBookLine {
        EntryRow entry;
        std::string account_code;
        std::string account_name;
        money_micro running_balance = 0;
    };

    struct DayBook {
        date day;
        money_micro opening_balance = 0;
        money_micro closing_balance = 0;
        money_micro total_debit = 0;
        money_micro total_credit = 0;
        money_micro cash_in = 0;
        money_micro cash_out = 0;
        std::vector<DayBookLine> entries;
    };

    /**
     * daily_summary
     * Opening is the cash account before the day. Lines are the day's entries
     * in (voucher id, entry id) order; running_balance moves only on cash
     * lines, so the last one equals closing_balance.
     */
    DayBook daily_summary(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                          int64_t cash_account_id, const date& day);

    struct StatementLine {
        int64_t account_id = 0;
        std::string code;
        std::string name;
        money_micro amount = 0;
    };

    struct ProfitAndLoss {
        std::string financial_year;
        date from;
        date to;
        std::vector<StatementLine> revenue;
        std::vector<StatementLine> expenses;
        money_micro total_revenue = 0;
        money_micro total_expenses = 0;
        money_micro net_profit = 0;
    };

    // Closing vouchers are left out so the report reads the same after closing.
    ProfitAndLoss profit_and_loss(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const FinancialYear& year);

    struct BalanceSheet {
        date as_of;
        std::vector<StatementLine> assets;
        std::vector<StatementLine> liabilities;
        std::vector<StatementLine> equity;
        money_micro current_earnings = 0;   // income less expense not yet closed
        money_micro total_assets = 0;
        money_micro total_liabilities = 0;
        money_micro total_equity = 0;       // includes current_earnings
        bool is_balanced = true;
    };

    BalanceSheet balance_sheet(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& as_of);

    struct AccountDaySummary {
        int64_t account_id = 0;
        std::string code;
        std::string name;
        AccountType type = AccountType::Asset;
        money_micro debit = 0;
        money_micro credit = 0;
        money_micro net = 0;
        int entry_count = 0;
    };

    std::vector<AccountDaySummary> account_wise_summary(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& day);

    struct DaySummary {
        date day;
        money_micro debit = 0;
        money_micro credit = 0;
        int voucher_count = 0;
        std::map<std::string, int> voucher_types;
    };

    // Throws LedgerError(InvalidDateRange) when from > to.
    std::vector<DaySummary> day_wise_summary(const std::vector<EntryRow>& rows, const date& from, const date& to);

    struct CustomerStatementLine {
        date day;
        int64_t voucher_id = 0;
        VoucherType voucher_type = VoucherType::Journal;
        std::string narration;
        money_micro debit = 0;
        money_micro credit = 0;
        money_micro running_balance = 0;
    };

    struct CustomerStatement {
        int64_t account_id = 0;
        std::string account_code;
        std::string account_name;
        date from;
        date to;
        money_micro opening_balance = 0;
        money_micro closing_balance = 0;
        money_micro total_debit = 0;
        money_micro total_credit = 0;
        std::vector<CustomerStatementLine> lines;
    };

    /**
     * customer_statement
     * Outstanding is debit-minus-credit on the customer's sub-account: what
     * the customer still owes.
     */
    CustomerStatement customer_statement(const Account& account, const std::vector<EntryRow>& rows,
                                         const date& from, const date& to);

} // namespace ppl

#endif // PPL_BALANCES_HPP
