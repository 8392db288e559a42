#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE closing
#include <boost/test/unit_test.hpp>

#include "closing.hpp"
#include "errors.hpp"
#include "t_ledger.h"

using namespace ppl;
using namespace ppl::testing;

namespace {

money_micro side_total(const std::vector<EntryDraft>& entries, Direction direction) {
    money_micro total = 0;
    for (const auto& e : entries) {
        if (e.direction == direction) total += e.amount;
    }
    return total;
}

const EntryDraft* line_for(const std::vector<EntryDraft>& entries, int64_t account_id) {
    for (const auto& e : entries) {
        if (e.account_id == account_id) return &e;
    }
    return nullptr;
}

} // namespace

struct closing_fixture {
    AccountIndex accounts;
    std::vector<EntryRow> rows;
    FinancialYear fy;

    closing_fixture() : accounts(standard_chart()), fy(FinancialYear::starting(2024)) {
        add_voucher(rows, 1, VoucherType::Journal, date(2024, 4, 1),
                    {dr(1001, units(100000)), cr(3001, units(100000))});
        add_voucher(rows, 2, VoucherType::LoanDisbursal, date(2024, 4, 10),
                    {dr(2001, units(50000)), cr(1001, units(49500)), cr(4002, units(500))});
        add_voucher(rows, 3, VoucherType::Receipt, date(2024, 4, 10),
                    {dr(1001, units(1000)), cr(4001, units(1000))});
        add_voucher(rows, 4, VoucherType::Journal, date(2024, 4, 15),
                    {dr(5002, units(2000)), cr(1001, units(2000))});
    }
};

BOOST_FIXTURE_TEST_SUITE(closing, closing_fixture)

BOOST_AUTO_TEST_CASE(testConfirmation)
{
    BOOST_CHECK_NO_THROW(require_confirmation("CONFIRM"));
    BOOST_CHECK_EXCEPTION(require_confirmation("confirm"), LedgerError,
                          [](const LedgerError& e) { return e.code() == "ConfirmationRequired"; });
    BOOST_CHECK_THROW(require_confirmation(""), LedgerError);
    BOOST_CHECK_EQUAL(std::string(kConfirmationToken), "CONFIRM");
}

BOOST_AUTO_TEST_CASE(testClosableYear)
{
    YearState state;
    BOOST_CHECK_NO_THROW(check_closable(fy, state, date(2025, 3, 31)));
    BOOST_CHECK_EXCEPTION(check_closable(fy, state, date(2025, 3, 30)), LedgerError,
                          [](const LedgerError& e) { return e.code() == "YearNotEnded"; });

    state.has_closing_voucher = true;
    BOOST_CHECK_EXCEPTION(check_closable(fy, state, date(2025, 6, 1)), LedgerError,
                          [](const LedgerError& e) { return e.code() == "AlreadyClosed"; });

    // A second close is refused as closed, even before the year ends.
    state = YearState();
    state.closed = true;
    BOOST_CHECK_EXCEPTION(check_closable(fy, state, date(2024, 6, 1)), LedgerError,
                          [](const LedgerError& e) {
                              return e.code() == "AlreadyClosed" && e.kind() == ErrorKind::StateConflict;
                          });
}

BOOST_AUTO_TEST_CASE(testOpenableYear)
{
    YearState prior;
    YearState state;
    BOOST_CHECK_EXCEPTION(check_openable(fy.next(), prior, state), LedgerError,
                          [](const LedgerError& e) { return e.code() == "PriorYearNotClosed"; });

    prior.closed = true;
    BOOST_CHECK_NO_THROW(check_openable(fy.next(), prior, state));

    state.opened = true;
    BOOST_CHECK_EXCEPTION(check_openable(fy.next(), prior, state), LedgerError,
                          [](const LedgerError& e) { return e.code() == "AlreadyOpened"; });
}

BOOST_AUTO_TEST_CASE(testClosingEntries)
{
    ClosingPlan plan = build_closing_entries(accounts, rows, fy, 3003);
    BOOST_CHECK_EQUAL(plan.total_revenue, units(1500));
    BOOST_CHECK_EQUAL(plan.total_expenses, units(2000));
    BOOST_CHECK_EQUAL(plan.net_profit, units(-500));

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 4u);
    BOOST_CHECK(line_for(plan.entries, 4001)->direction == Direction::Debit);
    BOOST_CHECK_EQUAL(line_for(plan.entries, 4001)->amount, units(1000));
    BOOST_CHECK(line_for(plan.entries, 5002)->direction == Direction::Credit);
    // A loss is debited to retained earnings.
    BOOST_CHECK(line_for(plan.entries, 3003)->direction == Direction::Debit);
    BOOST_CHECK_EQUAL(line_for(plan.entries, 3003)->amount, units(500));

    BOOST_CHECK_EQUAL(side_total(plan.entries, Direction::Debit), side_total(plan.entries, Direction::Credit));
}

BOOST_AUTO_TEST_CASE(testClosingZeroesIncomeAndExpense)
{
    ClosingPlan plan = build_closing_entries(accounts, rows, fy, 3003);
    std::vector<Line> lines;
    for (const auto& e : plan.entries) lines.push_back(Line{e.account_id, e.direction, e.amount});
    add_voucher(rows, 5, VoucherType::YearEndClosing, fy.end, lines);

    for (const Account* account : accounts.ordered_by_code()) {
        if (account->type == AccountType::Income || account->type == AccountType::Expense) {
            BOOST_CHECK_EQUAL(account_balance(*account, rows, fy.end), 0);
        }
    }
    BOOST_CHECK_EQUAL(account_balance(accounts.at(3003), rows, fy.end), units(-500));
}

BOOST_AUTO_TEST_CASE(testProfitCreditedAndContraBalances)
{
    add_voucher(rows, 6, VoucherType::Receipt, date(2024, 9, 1), {dr(1001, units(3000)), cr(4001, units(3000))});
    // a refund booked against other income leaves it with a debit balance
    add_voucher(rows, 7, VoucherType::Journal, date(2024, 9, 2), {dr(4020, units(100)), cr(1001, units(100))});

    ClosingPlan plan = build_closing_entries(accounts, rows, fy, 3003);
    BOOST_CHECK_EQUAL(plan.total_revenue, units(4400));
    BOOST_CHECK_EQUAL(plan.net_profit, units(2400));
    BOOST_CHECK(line_for(plan.entries, 4020)->direction == Direction::Credit);
    BOOST_CHECK(line_for(plan.entries, 3003)->direction == Direction::Credit);
    BOOST_CHECK_EQUAL(line_for(plan.entries, 3003)->amount, units(2400));
    BOOST_CHECK_EQUAL(side_total(plan.entries, Direction::Debit), side_total(plan.entries, Direction::Credit));
}

BOOST_AUTO_TEST_CASE(testClosingUsesTheYearOnly)
{
    add_voucher(rows, 8, VoucherType::Receipt, date(2023, 6, 1), {dr(1001, units(10)), cr(4020, units(10))});
    add_voucher(rows, 9, VoucherType::Receipt, date(2025, 4, 2), {dr(1001, units(10)), cr(4020, units(10))});

    ClosingPlan plan = build_closing_entries(accounts, rows, fy, 3003);
    BOOST_CHECK(line_for(plan.entries, 4020) == nullptr);
    BOOST_CHECK_EQUAL(plan.net_profit, units(-500));
}

BOOST_AUTO_TEST_CASE(testNothingToClose)
{
    ClosingPlan plan = build_closing_entries(accounts, rows, fy.next(), 3003);
    BOOST_CHECK(plan.entries.empty());
    BOOST_CHECK_EQUAL(plan.net_profit, 0);
}

BOOST_AUTO_TEST_CASE(testOpeningFoldsUnclosedEarnings)
{
    OpeningPlan plan = build_opening_entries(accounts, rows, fy.end, 3003);
    BOOST_CHECK_EQUAL(plan.total_debit, units(100000));
    BOOST_CHECK_EQUAL(plan.total_credit, units(100000));

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 4u);
    BOOST_CHECK_EQUAL(plan.entries[0].account_id, 1001);
    BOOST_CHECK(plan.entries[0].direction == Direction::Debit);
    BOOST_CHECK_EQUAL(plan.entries[0].amount, units(49500));
    // the customer owes the pledge: a debit on a liability account
    BOOST_CHECK_EQUAL(plan.entries[1].account_id, 2001);
    BOOST_CHECK(plan.entries[1].direction == Direction::Debit);
    BOOST_CHECK_EQUAL(plan.entries[2].account_id, 3001);
    BOOST_CHECK(plan.entries[2].direction == Direction::Credit);
    BOOST_CHECK_EQUAL(plan.entries[3].account_id, 3003);
    BOOST_CHECK(plan.entries[3].direction == Direction::Debit);
    BOOST_CHECK_EQUAL(plan.entries[3].amount, units(500));
}

BOOST_AUTO_TEST_CASE(testOpeningAfterClosingMatches)
{
    OpeningPlan unclosed = build_opening_entries(accounts, rows, fy.end, 3003);

    ClosingPlan closing = build_closing_entries(accounts, rows, fy, 3003);
    std::vector<Line> lines;
    for (const auto& e : closing.entries) lines.push_back(Line{e.account_id, e.direction, e.amount});
    add_voucher(rows, 5, VoucherType::YearEndClosing, fy.end, lines);

    OpeningPlan closed = build_opening_entries(accounts, rows, fy.end, 3003);
    BOOST_REQUIRE_EQUAL(closed.entries.size(), unclosed.entries.size());
    for (std::size_t i = 0; i < closed.entries.size(); i++) {
        BOOST_CHECK_EQUAL(closed.entries[i].account_id, unclosed.entries[i].account_id);
        BOOST_CHECK_EQUAL(closed.entries[i].amount, unclosed.entries[i].amount);
    }
}

BOOST_AUTO_TEST_CASE(testOpeningIgnoresEarlierOpening)
{
    add_voucher(rows, 20, VoucherType::YearOpening, fy.start, {dr(1001, units(77)), cr(3001, units(77))});
    OpeningPlan plan = build_opening_entries(accounts, rows, fy.end, 3003);
    BOOST_CHECK_EQUAL(plan.entries[0].amount, units(49500));
}

BOOST_AUTO_TEST_CASE(testUnbalancedOpening)
{
    add_voucher(rows, 30, VoucherType::Journal, date(2024, 6, 1), {dr(1001, units(5))});
    BOOST_CHECK_EXCEPTION(build_opening_entries(accounts, rows, fy.end, 3003), LedgerError,
                          [](const LedgerError& e) {
                              return e.code() == "InternalInvariant" && e.kind() == ErrorKind::Consistency;
                          });
}

BOOST_AUTO_TEST_SUITE_END()
