#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reversal
#include <boost/test/unit_test.hpp>

#include "balances.hpp"
#include "errors.hpp"
#include "posting.hpp"
#include "reversal.hpp"
#include "t_ledger.h"

using namespace ppl;
using namespace ppl::testing;

struct reversal_fixture {
    Voucher original;

    reversal_fixture() {
        original.id = 12;
        original.company_id = 1;
        original.type = VoucherType::Receipt;
        original.voucher_date = date(2024, 5, 2);
        original.narration = "Payment against pledge GL-0001 receipt RCPT-HO-2024-00001";

        LedgerEntry cash;
        cash.id = 31;
        cash.voucher_id = 12;
        cash.account_id = 1001;
        cash.direction = Direction::Debit;
        cash.amount = units(5000);
        cash.narration = "Received cash";
        cash.reference = Reference{"payment", 4};

        LedgerEntry customer = cash;
        customer.id = 32;
        customer.account_id = 9001;
        customer.direction = Direction::Credit;
        customer.amount = units(3200);
        customer.narration = "Principal repaid GL-0001";
        customer.reference.reset();

        LedgerEntry interest = customer;
        interest.id = 33;
        interest.account_id = 4001;
        interest.amount = units(1800);
        interest.narration = "Interest GL-0001";

        original.entries = {cash, customer, interest};
    }
};

BOOST_FIXTURE_TEST_SUITE(reversal, reversal_fixture)

BOOST_AUTO_TEST_CASE(testMirrorsEveryLine)
{
    VoucherDraft mirror = ReversalEngine::build_reversal(original, "auditor", "wrong amount", date(2024, 5, 9));

    BOOST_CHECK(mirror.type == VoucherType::Journal);
    BOOST_CHECK_EQUAL(mirror.voucher_date, date(2024, 5, 9));
    BOOST_CHECK_EQUAL(mirror.company_id, 1);
    BOOST_REQUIRE(mirror.reverses_voucher_id);
    BOOST_CHECK_EQUAL(*mirror.reverses_voucher_id, 12);
    BOOST_CHECK_EQUAL(mirror.narration, "Reversal of voucher #12: wrong amount");
    BOOST_CHECK_EQUAL(mirror.actor, "auditor");

    BOOST_REQUIRE_EQUAL(mirror.entries.size(), 3u);
    for (std::size_t i = 0; i < original.entries.size(); i++) {
        BOOST_CHECK_EQUAL(mirror.entries[i].account_id, original.entries[i].account_id);
        BOOST_CHECK_EQUAL(mirror.entries[i].amount, original.entries[i].amount);
        BOOST_CHECK(mirror.entries[i].direction != original.entries[i].direction);
    }
    BOOST_CHECK_EQUAL(mirror.entries[0].narration, "Reversal: Received cash");
}

BOOST_AUTO_TEST_CASE(testReferences)
{
    VoucherDraft mirror = ReversalEngine::build_reversal(original, "auditor", "", date(2024, 5, 9));
    BOOST_CHECK_EQUAL(mirror.narration, "Reversal of voucher #12");

    BOOST_REQUIRE(mirror.entries[0].reference);
    BOOST_CHECK_EQUAL(mirror.entries[0].reference->kind, "payment");
    BOOST_CHECK_EQUAL(mirror.entries[0].reference->id, 4);

    BOOST_REQUIRE(mirror.entries[1].reference);
    BOOST_CHECK_EQUAL(mirror.entries[1].reference->kind, "voucher");
    BOOST_CHECK_EQUAL(mirror.entries[1].reference->id, 12);
}

BOOST_AUTO_TEST_CASE(testMirrorIsPostable)
{
    VoucherDraft mirror = ReversalEngine::build_reversal(original, "auditor", "", date(2024, 5, 9));
    PostingTotals totals = PostingEngine::validate_voucher(mirror);
    BOOST_CHECK_EQUAL(totals.debit, original.total_credit());
    BOOST_CHECK_EQUAL(totals.credit, original.total_debit());
}

BOOST_AUTO_TEST_CASE(testNetsToZero)
{
    AccountIndex accounts = standard_chart();
    Account customer = make_account(9001, "2001-001", "Customer - A", AccountType::Liability);
    customer.parent_id = 2001;
    accounts.add(customer);

    std::vector<EntryRow> rows;
    std::vector<Line> lines;
    for (const auto& e : original.entries) lines.push_back(Line{e.account_id, e.direction, e.amount});
    add_voucher(rows, original.id, original.type, original.voucher_date, lines);

    TrialBalance before = trial_balance(accounts, rows, date(2024, 5, 31));

    VoucherDraft mirror = ReversalEngine::build_reversal(original, "auditor", "", date(2024, 5, 9));
    std::vector<Line> mirrored;
    for (const auto& e : mirror.entries) mirrored.push_back(Line{e.account_id, e.direction, e.amount});
    add_voucher(rows, 13, mirror.type, mirror.voucher_date, mirrored);

    TrialBalance after = trial_balance(accounts, rows, date(2024, 5, 31));
    BOOST_CHECK_EQUAL(before.total_debit, units(5000));
    BOOST_CHECK_EQUAL(after.total_debit, 0);
    BOOST_CHECK_EQUAL(after.total_credit, 0);
    BOOST_CHECK_EQUAL(account_balance(accounts.at(9001), rows, date(2024, 5, 31)), 0);
    BOOST_CHECK_EQUAL(account_balance(accounts.at(1001), rows, date(2024, 5, 31)), 0);
}

BOOST_AUTO_TEST_CASE(testNothingToReverse)
{
    original.entries.clear();
    BOOST_CHECK_EXCEPTION(ReversalEngine::build_reversal(original, "auditor", "", date(2024, 5, 9)), LedgerError,
                          [](const LedgerError& e) { return e.code() == "NothingToReverse"; });
}

BOOST_AUTO_TEST_SUITE_END()
