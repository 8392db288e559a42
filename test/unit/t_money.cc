#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE money
#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "money.hpp"

using namespace ppl;

namespace {

bool has_code(const LedgerError& e, const char* code) {
    return e.code() == code;
}

} // namespace

struct money_fixture {
    money_fixture() {}
};

BOOST_FIXTURE_TEST_SUITE(money, money_fixture)

BOOST_AUTO_TEST_CASE(testParse)
{
    BOOST_CHECK_EQUAL(parse_money("1234.56"), 1234560000);
    BOOST_CHECK_EQUAL(parse_money("-12"), -12000000);
    BOOST_CHECK_EQUAL(parse_money("+0.5"), 500000);
    BOOST_CHECK_EQUAL(parse_money(".25"), 250000);
    BOOST_CHECK_EQUAL(parse_money("0.000001"), 1);
    BOOST_CHECK_EQUAL(parse_money("100000"), units(100000));
}

BOOST_AUTO_TEST_CASE(testParseRejects)
{
    BOOST_CHECK_EXCEPTION(parse_money(""), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(parse_money("12.3.4"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(parse_money("1e5"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(parse_money("0.0000001"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(parse_money("1234567890123"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_THROW(parse_money("-"), LedgerError);
}

BOOST_AUTO_TEST_CASE(testBounds)
{
    BOOST_CHECK_EQUAL(units(10000000000LL), kMaxAmount);
    BOOST_CHECK_EQUAL(units(-10000000000LL), -kMaxAmount);
    BOOST_CHECK_EXCEPTION(units(10000000000000LL), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(units(-10000000001LL), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });

    BOOST_CHECK_EQUAL(parse_money("10000000000.00"), kMaxAmount);
    BOOST_CHECK_EXCEPTION(parse_money("999999999999.99"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(parse_money("-10000000000.01"), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
}

BOOST_AUTO_TEST_CASE(testCheckedAdd)
{
    BOOST_CHECK_EQUAL(checked_add(units(2), units(3)), units(5));
    BOOST_CHECK_EQUAL(checked_add(units(2), -units(3)), -units(1));

    money_micro total = 0;
    for (int i = 0; i < 922; ++i) total = checked_add(total, kMaxAmount);
    BOOST_CHECK_EXCEPTION(checked_add(total, kMaxAmount), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
    BOOST_CHECK_EXCEPTION(checked_add(-total, -kMaxAmount), LedgerError,
                          [](const LedgerError& e) { return has_code(e, "InvalidAmount"); });
}

BOOST_AUTO_TEST_CASE(testFormat)
{
    BOOST_CHECK_EQUAL(format_money(units(91800)), "91800.00");
    BOOST_CHECK_EQUAL(format_money(parse_money("0.05")), "0.05");
    BOOST_CHECK_EQUAL(format_money(parse_money("-0.02")), "-0.02");
    BOOST_CHECK_EQUAL(format_money(0), "0.00");
    BOOST_CHECK_EQUAL(format_money(parse_money("399999.98")), "399999.98");
}

BOOST_AUTO_TEST_CASE(testTolerance)
{
    BOOST_CHECK(within_tolerance(units(100), units(100)));
    BOOST_CHECK(within_tolerance(units(100), units(100) + 9999));
    BOOST_CHECK(!within_tolerance(units(100), units(100) + kTolerance));
    BOOST_CHECK(!within_tolerance(units(1000000), parse_money("999999.98")));

    BOOST_CHECK(settled(units(100), units(100)));
    BOOST_CHECK(settled(units(100), units(100) - kTolerance));
    BOOST_CHECK(!settled(units(100), units(100) - kTolerance - 1));
    BOOST_CHECK(settled(units(100), units(150)));
}

BOOST_AUTO_TEST_CASE(testRounding)
{
    BOOST_CHECK(is_whole_cents(parse_money("10.25")));
    BOOST_CHECK(!is_whole_cents(parse_money("10.255")));

    BOOST_CHECK_EQUAL(round_to_cents(parse_money("10.255")), parse_money("10.26"));
    BOOST_CHECK_EQUAL(round_to_cents(parse_money("10.254999")), parse_money("10.25"));
    BOOST_CHECK_EQUAL(round_to_cents(parse_money("-10.255")), parse_money("-10.26"));
    BOOST_CHECK_EQUAL(round_to_cents(parse_money("-10.254")), parse_money("-10.25"));
}

BOOST_AUTO_TEST_CASE(testApplyRate)
{
    // 2% a month
    BOOST_CHECK_EQUAL(apply_rate(units(100000), 20000), units(2000));
    BOOST_CHECK_EQUAL(apply_rate(units(50000), 15000), units(750));
    // 1.75% of 333.33 = 5.833275 -> 5.83
    BOOST_CHECK_EQUAL(apply_rate(parse_money("333.33"), 17500), parse_money("5.83"));
    // 2% of 0.25 = 0.005 -> 0.01
    BOOST_CHECK_EQUAL(apply_rate(parse_money("0.25"), 20000), parse_money("0.01"));
    BOOST_CHECK_EQUAL(apply_rate(units(100000), 0), 0);
}

BOOST_AUTO_TEST_CASE(testRates)
{
    BOOST_CHECK_EQUAL(parse_rate_percent("2"), 20000);
    BOOST_CHECK_EQUAL(parse_rate_percent("1.75"), 17500);
    BOOST_CHECK_EQUAL(format_rate_percent(20000), "2");
    BOOST_CHECK_EQUAL(format_rate_percent(17500), "1.75");
    BOOST_CHECK_EQUAL(format_rate_percent(1250), "0.125");
    BOOST_CHECK_THROW(parse_rate_percent("-1"), LedgerError);
}

BOOST_AUTO_TEST_SUITE_END()
