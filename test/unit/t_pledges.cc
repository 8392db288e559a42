#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE pledges
#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "pledges.hpp"
#include "posting.hpp"

using namespace ppl;

namespace {

bool code_is(const LedgerError& e, const std::string& code) {
    return e.code() == code;
}

} // namespace

struct pledges_fixture {
    Pledge pledge;
    PostingAccounts accounts;
    PaymentRequest request;
    Payment payment;

    pledges_fixture() {
        pledge.id = 3;
        pledge.company_id = 1;
        pledge.pledge_no = "GL-0003";
        pledge.principal = units(90000);
        pledge.document_charges = units(250);
        pledge.first_month_interest = units(1800);
        pledge.monthly_rate = 20000;
        pledge.pledge_date = date(2024, 1, 1);

        accounts.cash = 1001;
        accounts.bank = 1002;
        accounts.customer = 9001;
        accounts.interest_income = 4001;
        accounts.document_income = 4002;
        accounts.penalty_income = 4005;
        accounts.discount_expense = 5008;

        request.company_id = 1;
        request.pledge_id = 3;
        request.payment_date = date(2024, 2, 5);
        request.amount = units(11900);
        request.interest = units(1800);
        request.principal = units(10000);
        request.penalty = units(100);

        payment.id = 8;
        payment.pledge_id = 3;
        payment.kind = PaymentKind::Regular;
        payment.payment_date = request.payment_date;
        payment.created_on = request.payment_date;
        payment.amount = request.amount;
        payment.interest = request.interest;
        payment.principal = request.principal;
        payment.penalty = request.penalty;
        payment.method = "cash";
        payment.receipt_no = "RCPT-HO-2024-00001";
    }

    const EntryDraft* line_for(const VoucherDraft& draft, int64_t account_id) const {
        for (const auto& e : draft.entries) {
            if (e.account_id == account_id) return &e;
        }
        return nullptr;
    }
};

BOOST_FIXTURE_TEST_SUITE(pledges, pledges_fixture)

BOOST_AUTO_TEST_CASE(testBreakdown)
{
    BOOST_CHECK_NO_THROW(validate_payment_breakdown(request));

    request.amount = units(12000);
    BOOST_CHECK_EXCEPTION(validate_payment_breakdown(request), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "InvalidPaymentBreakdown"); });

    request.amount = 0;
    BOOST_CHECK_EXCEPTION(validate_payment_breakdown(request), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "NonPositiveAmount"); });
}

BOOST_AUTO_TEST_CASE(testBreakdownComponents)
{
    request.discount = units(-1);
    BOOST_CHECK_EXCEPTION(validate_payment_breakdown(request), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "NonPositiveAmount"); });

    request.discount = parse_money("0.005");
    BOOST_CHECK_EXCEPTION(validate_payment_breakdown(request), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "InvalidAmount"); });
}

BOOST_AUTO_TEST_CASE(testBreakdownOutOfRange)
{
    request.principal = kMaxAmount + kMicrosPerCent;
    request.amount = request.interest + request.principal + request.penalty;
    BOOST_CHECK_EXCEPTION(validate_payment_breakdown(request), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "InvalidAmount"); });
}

BOOST_AUTO_TEST_CASE(testPaymentDateNotFuture)
{
    date today(2024, 2, 5);
    BOOST_CHECK_NO_THROW(require_not_future(today, today));
    BOOST_CHECK_NO_THROW(require_not_future(date(2024, 2, 4), today));
    BOOST_CHECK_EXCEPTION(require_not_future(date(2024, 2, 6), today), LedgerError,
                          [](const LedgerError& e) { return code_is(e, "InvalidArgument"); });
}

BOOST_AUTO_TEST_CASE(testNumbers)
{
    BOOST_CHECK_EQUAL(sequence_number("RCPT", "HO", 2024, 42), "RCPT-HO-2024-00042");
    BOOST_CHECK_EQUAL(sequence_number("FI", "HO", 2024, 1), "FI-HO-2024-00001");
    BOOST_CHECK_EQUAL(pledge_number("GL", 7), "GL-0007");
    BOOST_CHECK_EQUAL(pledge_number("", 12345), "PL-12345");
}

BOOST_AUTO_TEST_CASE(testBankMethods)
{
    BOOST_CHECK(is_bank_method("upi"));
    BOOST_CHECK(is_bank_method("cheque"));
    BOOST_CHECK(is_bank_method("bank_transfer"));
    BOOST_CHECK(!is_bank_method("cash"));
    BOOST_CHECK(!is_bank_method("auto"));
}

BOOST_AUTO_TEST_CASE(testDisbursalVoucher)
{
    VoucherDraft draft = build_disbursal_voucher(pledge, accounts, "Asha Rao", "teller");
    BOOST_CHECK(draft.type == VoucherType::LoanDisbursal);
    BOOST_CHECK_EQUAL(draft.voucher_date, pledge.pledge_date);
    BOOST_REQUIRE_EQUAL(draft.entries.size(), 3u);

    BOOST_CHECK(line_for(draft, 9001)->direction == Direction::Debit);
    BOOST_CHECK_EQUAL(line_for(draft, 9001)->amount, units(90000));
    BOOST_CHECK_EQUAL(line_for(draft, 1001)->amount, units(89750));
    BOOST_CHECK_EQUAL(line_for(draft, 4002)->amount, units(250));
    BOOST_CHECK_EQUAL(line_for(draft, 1001)->reference->kind, "pledge");

    PostingTotals totals = PostingEngine::validate_voucher(draft);
    BOOST_CHECK_EQUAL(totals.debit, totals.credit);
}

BOOST_AUTO_TEST_CASE(testDisbursalWithoutCharges)
{
    pledge.document_charges = 0;
    VoucherDraft draft = build_disbursal_voucher(pledge, accounts, "Asha Rao", "teller");
    BOOST_CHECK_EQUAL(draft.entries.size(), 2u);
    BOOST_CHECK(line_for(draft, 4002) == nullptr);
}

BOOST_AUTO_TEST_CASE(testFirstInterestVoucher)
{
    Payment first;
    first.id = 5;
    first.kind = PaymentKind::FirstInterest;
    first.payment_date = pledge.pledge_date;
    first.amount = units(1800);
    first.interest = units(1800);
    first.receipt_no = "FI-HO-2024-00001";

    VoucherDraft draft = build_first_interest_voucher(pledge, first, accounts, "teller");
    BOOST_CHECK(draft.type == VoucherType::Receipt);
    BOOST_REQUIRE_EQUAL(draft.entries.size(), 2u);
    BOOST_CHECK(line_for(draft, 1001)->direction == Direction::Debit);
    BOOST_CHECK(line_for(draft, 4001)->direction == Direction::Credit);
    BOOST_CHECK_EQUAL(line_for(draft, 4001)->amount, units(1800));
}

BOOST_AUTO_TEST_CASE(testPaymentVoucher)
{
    VoucherDraft draft = build_payment_voucher(pledge, payment, accounts, "teller");
    BOOST_REQUIRE_EQUAL(draft.entries.size(), 4u);
    BOOST_CHECK_EQUAL(line_for(draft, 1001)->amount, units(11900));
    BOOST_CHECK_EQUAL(line_for(draft, 9001)->amount, units(10000));
    BOOST_CHECK(line_for(draft, 9001)->direction == Direction::Credit);
    BOOST_CHECK_EQUAL(line_for(draft, 4001)->amount, units(1800));
    BOOST_CHECK_EQUAL(line_for(draft, 4005)->amount, units(100));
    BOOST_CHECK(line_for(draft, 5008) == nullptr);
    BOOST_CHECK_NO_THROW(PostingEngine::validate_voucher(draft));
}

BOOST_AUTO_TEST_CASE(testPaymentVoucherWithDiscountByBank)
{
    payment.method = "upi";
    payment.penalty = 0;
    payment.amount = units(11800);
    payment.discount = units(50);

    VoucherDraft draft = build_payment_voucher(pledge, payment, accounts, "teller");
    BOOST_CHECK(line_for(draft, 1001) == nullptr);
    BOOST_CHECK_EQUAL(line_for(draft, 1002)->amount, units(11800));
    BOOST_CHECK(line_for(draft, 5008)->direction == Direction::Debit);
    BOOST_CHECK_EQUAL(line_for(draft, 9001)->amount, units(10050));
    BOOST_CHECK(line_for(draft, 4005) == nullptr);

    PostingTotals totals = PostingEngine::validate_voucher(draft);
    BOOST_CHECK_EQUAL(totals.debit, units(11850));
    BOOST_CHECK_EQUAL(totals.credit, units(11850));
}

BOOST_AUTO_TEST_CASE(testModifiability)
{
    Modifiability fresh = payment_modifiability(payment, payment.created_on + boost::gregorian::days(3), 30, 7);
    BOOST_CHECK_EQUAL(fresh.age_days, 3);
    BOOST_CHECK(fresh.can_update);
    BOOST_CHECK(fresh.can_delete);

    Modifiability week = payment_modifiability(payment, payment.created_on + boost::gregorian::days(7), 30, 7);
    BOOST_CHECK(week.can_delete);

    Modifiability older = payment_modifiability(payment, payment.created_on + boost::gregorian::days(8), 30, 7);
    BOOST_CHECK(older.can_update);
    BOOST_CHECK(!older.can_delete);
    BOOST_CHECK(!older.reason.empty());

    Modifiability old = payment_modifiability(payment, payment.created_on + boost::gregorian::days(31), 30, 7);
    BOOST_CHECK(!old.can_update);
    BOOST_CHECK(!old.can_delete);
}

BOOST_AUTO_TEST_CASE(testAgeCountsFromEntry)
{
    // Back-dated payment entered today is still fresh.
    payment.payment_date = date(2023, 12, 1);
    Modifiability m = payment_modifiability(payment, payment.created_on, 30, 7);
    BOOST_CHECK_EQUAL(m.age_days, 0);
    BOOST_CHECK(m.can_delete);
}

BOOST_AUTO_TEST_CASE(testFirstInterestLocked)
{
    payment.kind = PaymentKind::FirstInterest;
    Modifiability m = payment_modifiability(payment, payment.created_on, 30, 7);
    BOOST_CHECK(!m.can_update);
    BOOST_CHECK(!m.can_delete);
}

BOOST_AUTO_TEST_SUITE_END()
