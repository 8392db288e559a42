#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE balances
#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "balances.hpp"
#include "errors.hpp"
#include "t_ledger.h"

using namespace ppl;
using namespace ppl::testing;

struct balances_fixture {
    AccountIndex accounts;
    std::vector<EntryRow> rows;

    balances_fixture() : accounts(standard_chart()) {
        add_voucher(rows, 1, VoucherType::Journal, date(2024, 4, 1),
                    {dr(1001, units(100000)), cr(3001, units(100000))}, "Capital introduced");
        add_voucher(rows, 2, VoucherType::LoanDisbursal, date(2024, 4, 10),
                    {dr(2001, units(50000)), cr(1001, units(49500)), cr(4002, units(500))}, "Pledge GL-0001");
        add_voucher(rows, 3, VoucherType::Receipt, date(2024, 4, 10),
                    {dr(1001, units(1000)), cr(4001, units(1000))}, "First month interest");
        add_voucher(rows, 4, VoucherType::Journal, date(2024, 4, 15),
                    {dr(5002, units(2000)), cr(1001, units(2000))}, "April rent");
    }

    const Account& account(const char* code) const {
        return *accounts.find_code(code);
    }
};

BOOST_FIXTURE_TEST_SUITE(balances, balances_fixture)

BOOST_AUTO_TEST_CASE(testAccountBalance)
{
    BOOST_CHECK_EQUAL(account_balance(account("1001"), rows, date(2024, 3, 31)), 0);
    BOOST_CHECK_EQUAL(account_balance(account("1001"), rows, date(2024, 4, 10)), units(51500));
    BOOST_CHECK_EQUAL(account_balance(account("1001"), rows, date(2024, 4, 30)), units(49500));
    BOOST_CHECK_EQUAL(account_balance(account("3001"), rows, date(2024, 4, 30)), units(100000));
    BOOST_CHECK_EQUAL(account_balance(account("5002"), rows, date(2024, 4, 30)), units(2000));
    // Customer liabilities carry the pledge as a debit.
    BOOST_CHECK_EQUAL(account_balance(account("2001"), rows, date(2024, 4, 30)), units(-50000));
}

BOOST_AUTO_TEST_CASE(testYearOpeningNotCountedTwice)
{
    add_voucher(rows, 5, VoucherType::YearOpening, date(2025, 4, 1),
                {dr(1001, units(49500)), cr(3001, units(49500))}, "Opening balances FY 2025-26");
    BOOST_CHECK_EQUAL(account_balance(account("1001"), rows, date(2025, 4, 30)), units(49500));
}

BOOST_AUTO_TEST_CASE(testTrialBalance)
{
    TrialBalance tb = trial_balance(accounts, rows, date(2024, 4, 30));
    BOOST_CHECK_EQUAL(tb.lines.size(), 23u);
    BOOST_CHECK_EQUAL(tb.total_debit, units(101500));
    BOOST_CHECK_EQUAL(tb.total_credit, units(101500));
    BOOST_CHECK(tb.is_balanced);

    auto cash = std::find_if(tb.lines.begin(), tb.lines.end(),
                             [](const TrialBalanceLine& l) { return l.code == "1001"; });
    BOOST_REQUIRE(cash != tb.lines.end());
    BOOST_CHECK_EQUAL(cash->debit, units(49500));
    BOOST_CHECK_EQUAL(cash->credit, 0);
}

BOOST_AUTO_TEST_CASE(testTrialBalanceInactiveAccounts)
{
    AccountIndex changed;
    for (const Account* a : accounts.ordered_by_code()) {
        Account copy = *a;
        if (copy.code == "5030" || copy.code == "5002") copy.active = false;
        changed.add(copy);
    }

    TrialBalance tb = trial_balance(changed, rows, date(2024, 4, 30));
    // 5030 is idle and drops out; 5002 still carries rent.
    BOOST_CHECK_EQUAL(tb.lines.size(), 22u);
    BOOST_CHECK_EQUAL(tb.total_debit, tb.total_credit);
    BOOST_CHECK(tb.is_balanced);
}

BOOST_AUTO_TEST_CASE(testTrialBalanceRejectsUnknownAccount)
{
    add_voucher(rows, 9, VoucherType::Journal, date(2024, 4, 20), {dr(8888, units(1)), cr(1001, units(1))});
    BOOST_CHECK_THROW(trial_balance(accounts, rows, date(2024, 4, 30)), LedgerError);
}

BOOST_AUTO_TEST_CASE(testDayBook)
{
    DayBook book = daily_summary(accounts, rows, 1001, date(2024, 4, 10));
    BOOST_CHECK_EQUAL(book.opening_balance, units(100000));
    BOOST_CHECK_EQUAL(book.closing_balance, units(51500));
    BOOST_CHECK_EQUAL(book.cash_in, units(1000));
    BOOST_CHECK_EQUAL(book.cash_out, units(49500));
    BOOST_CHECK_EQUAL(book.total_debit, units(51000));
    BOOST_CHECK_EQUAL(book.total_credit, units(51000));

    BOOST_REQUIRE_EQUAL(book.entries.size(), 5u);
    BOOST_CHECK_EQUAL(book.entries[0].account_code, "2001");
    BOOST_CHECK_EQUAL(book.entries[0].running_balance, units(100000));
    BOOST_CHECK_EQUAL(book.entries[1].running_balance, units(50500));
    BOOST_CHECK_EQUAL(book.entries[3].running_balance, units(51500));
    BOOST_CHECK_EQUAL(book.entries.back().running_balance, book.closing_balance);
}

BOOST_AUTO_TEST_CASE(testEmptyDayBook)
{
    DayBook book = daily_summary(accounts, rows, 1001, date(2024, 4, 12));
    BOOST_CHECK(book.entries.empty());
    BOOST_CHECK_EQUAL(book.opening_balance, units(51500));
    BOOST_CHECK_EQUAL(book.closing_balance, units(51500));
}

BOOST_AUTO_TEST_CASE(testProfitAndLoss)
{
    FinancialYear fy = FinancialYear::starting(2024);
    ProfitAndLoss pl = profit_and_loss(accounts, rows, fy);
    BOOST_CHECK_EQUAL(pl.financial_year, "2024-25");
    BOOST_CHECK_EQUAL(pl.total_revenue, units(1500));
    BOOST_CHECK_EQUAL(pl.total_expenses, units(2000));
    BOOST_CHECK_EQUAL(pl.net_profit, units(-500));
    BOOST_REQUIRE_EQUAL(pl.revenue.size(), 2u);
    BOOST_CHECK_EQUAL(pl.revenue[0].code, "4001");
    BOOST_CHECK_EQUAL(pl.revenue[1].code, "4002");

    // The closing voucher does not change the report.
    add_voucher(rows, 10, VoucherType::YearEndClosing, date(2025, 3, 31),
                {dr(4001, units(1000)), dr(4002, units(500)), cr(5002, units(2000)), dr(3003, units(500))});
    ProfitAndLoss after = profit_and_loss(accounts, rows, fy);
    BOOST_CHECK_EQUAL(after.net_profit, units(-500));
    BOOST_CHECK_EQUAL(after.total_revenue, units(1500));

    BOOST_CHECK_EQUAL(profit_and_loss(accounts, rows, fy.next()).net_profit, 0);
}

BOOST_AUTO_TEST_CASE(testBalanceSheet)
{
    BalanceSheet bs = balance_sheet(accounts, rows, date(2024, 4, 30));
    BOOST_CHECK_EQUAL(bs.total_assets, units(49500));
    BOOST_CHECK_EQUAL(bs.total_liabilities, units(-50000));
    BOOST_CHECK_EQUAL(bs.current_earnings, units(-500));
    BOOST_CHECK_EQUAL(bs.total_equity, units(99500));
    BOOST_CHECK(bs.is_balanced);
}

BOOST_AUTO_TEST_CASE(testBalanceSheetAfterClosing)
{
    add_voucher(rows, 10, VoucherType::YearEndClosing, date(2025, 3, 31),
                {dr(4001, units(1000)), dr(4002, units(500)), cr(5002, units(2000)), dr(3003, units(500))});

    BalanceSheet bs = balance_sheet(accounts, rows, date(2025, 3, 31));
    BOOST_CHECK_EQUAL(bs.current_earnings, 0);
    BOOST_CHECK_EQUAL(bs.total_equity, units(99500));
    BOOST_REQUIRE_EQUAL(bs.equity.size(), 2u);
    BOOST_CHECK_EQUAL(bs.equity[1].code, "3003");
    BOOST_CHECK_EQUAL(bs.equity[1].amount, units(-500));
    BOOST_CHECK(bs.is_balanced);
}

BOOST_AUTO_TEST_CASE(testAccountWiseSummary)
{
    std::vector<AccountDaySummary> summary = account_wise_summary(accounts, rows, date(2024, 4, 10));
    BOOST_REQUIRE_EQUAL(summary.size(), 4u);
    BOOST_CHECK_EQUAL(summary[0].code, "1001");
    BOOST_CHECK_EQUAL(summary[0].debit, units(1000));
    BOOST_CHECK_EQUAL(summary[0].credit, units(49500));
    BOOST_CHECK_EQUAL(summary[0].net, units(-48500));
    BOOST_CHECK_EQUAL(summary[0].entry_count, 2);
    BOOST_CHECK_EQUAL(summary[3].code, "4002");
    BOOST_CHECK_EQUAL(summary[3].net, units(500));
}

BOOST_AUTO_TEST_CASE(testDayWiseSummary)
{
    std::vector<DaySummary> days = day_wise_summary(rows, date(2024, 4, 1), date(2024, 4, 30));
    BOOST_REQUIRE_EQUAL(days.size(), 3u);
    BOOST_CHECK_EQUAL(days[1].day, date(2024, 4, 10));
    BOOST_CHECK_EQUAL(days[1].voucher_count, 2);
    BOOST_CHECK_EQUAL(days[1].debit, units(51000));
    BOOST_CHECK_EQUAL(days[1].voucher_types.at("loan_disbursal"), 1);
    BOOST_CHECK_EQUAL(days[1].voucher_types.at("receipt"), 1);

    BOOST_CHECK(day_wise_summary(rows, date(2024, 5, 1), date(2024, 5, 31)).empty());
    BOOST_CHECK_EXCEPTION(day_wise_summary(rows, date(2024, 5, 1), date(2024, 4, 1)), LedgerError,
                          [](const LedgerError& e) { return e.code() == "InvalidDateRange"; });
}

BOOST_AUTO_TEST_CASE(testCustomerStatement)
{
    add_voucher(rows, 5, VoucherType::Receipt, date(2024, 4, 20),
                {dr(1001, units(10000)), cr(2001, units(10000))}, "Part payment");

    CustomerStatement st = customer_statement(account("2001"), rows, date(2024, 4, 1), date(2024, 4, 30));
    BOOST_CHECK_EQUAL(st.opening_balance, 0);
    BOOST_REQUIRE_EQUAL(st.lines.size(), 2u);
    BOOST_CHECK_EQUAL(st.lines[0].running_balance, units(50000));
    BOOST_CHECK_EQUAL(st.lines[1].running_balance, units(40000));
    BOOST_CHECK_EQUAL(st.lines[1].narration, "Part payment");
    BOOST_CHECK_EQUAL(st.closing_balance, units(40000));
    BOOST_CHECK_EQUAL(st.total_debit, units(50000));
    BOOST_CHECK_EQUAL(st.total_credit, units(10000));

    CustomerStatement later = customer_statement(account("2001"), rows, date(2024, 4, 11), date(2024, 4, 30));
    BOOST_CHECK_EQUAL(later.opening_balance, units(50000));
    BOOST_CHECK_EQUAL(later.lines.size(), 1u);
    BOOST_CHECK_EQUAL(later.closing_balance, units(40000));
}

BOOST_AUTO_TEST_CASE(testSortForReporting)
{
    std::vector<EntryRow> shuffled(rows.rbegin(), rows.rend());
    sort_for_reporting(shuffled);
    BOOST_REQUIRE_EQUAL(shuffled.size(), rows.size());
    for (std::size_t i = 0; i < rows.size(); i++) {
        BOOST_CHECK_EQUAL(shuffled[i].entry_id, rows[i].entry_id);
    }
}

BOOST_AUTO_TEST_SUITE_END()
