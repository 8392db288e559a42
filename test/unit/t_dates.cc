#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE dates
#include <boost/test/unit_test.hpp>

#include "dates.hpp"
#include "errors.hpp"

using namespace ppl;

struct dates_fixture {
    date jan15;
    date jan31;

    dates_fixture() : jan15(2024, 1, 15), jan31(2024, 1, 31) {}
};

BOOST_FIXTURE_TEST_SUITE(dates, dates_fixture)

BOOST_AUTO_TEST_CASE(testAddMonths)
{
    BOOST_CHECK_EQUAL(add_months(jan15, 1), date(2024, 2, 15));
    BOOST_CHECK_EQUAL(add_months(jan31, 1), date(2024, 2, 29));
    BOOST_CHECK_EQUAL(add_months(date(2023, 1, 31), 1), date(2023, 2, 28));
    BOOST_CHECK_EQUAL(add_months(jan15, 12), date(2025, 1, 15));
    BOOST_CHECK_EQUAL(add_months(jan15, -1), date(2023, 12, 15));
    BOOST_CHECK_EQUAL(add_months(jan31, 3), date(2024, 4, 30));
}

BOOST_AUTO_TEST_CASE(testCompletedMonths)
{
    BOOST_CHECK_EQUAL(completed_months(jan15, jan15), 0);
    BOOST_CHECK_EQUAL(completed_months(jan15, date(2024, 2, 14)), 0);
    BOOST_CHECK_EQUAL(completed_months(jan15, date(2024, 2, 15)), 1);
    BOOST_CHECK_EQUAL(completed_months(jan15, date(2024, 4, 20)), 3);
    BOOST_CHECK_EQUAL(completed_months(jan31, date(2024, 2, 29)), 1);
    BOOST_CHECK_EQUAL(completed_months(jan31, date(2024, 2, 28)), 0);
    BOOST_CHECK_EQUAL(completed_months(jan15, date(2023, 12, 1)), 0);
}

BOOST_AUTO_TEST_CASE(testParseDate)
{
    BOOST_CHECK_EQUAL(parse_date("2024-03-01"), date(2024, 3, 1));
    BOOST_CHECK_EQUAL(format_date(date(2024, 3, 1)), "2024-03-01");

    BOOST_CHECK_THROW(parse_date("2024/03/01"), LedgerError);
    BOOST_CHECK_THROW(parse_date("2024-3-1"), LedgerError);
    BOOST_CHECK_THROW(parse_date("2023-02-29"), LedgerError);
    BOOST_CHECK_THROW(parse_date(""), LedgerError);
}

BOOST_AUTO_TEST_CASE(testFinancialYear)
{
    FinancialYear fy = FinancialYear::starting(2024);
    BOOST_CHECK_EQUAL(fy.start, date(2024, 4, 1));
    BOOST_CHECK_EQUAL(fy.end, date(2025, 3, 31));
    BOOST_CHECK_EQUAL(fy.label(), "2024-25");

    BOOST_CHECK(fy.contains(date(2025, 3, 31)));
    BOOST_CHECK(!fy.contains(date(2025, 4, 1)));

    BOOST_CHECK_EQUAL(FinancialYear::containing(date(2025, 2, 10)).label(), "2024-25");
    BOOST_CHECK_EQUAL(FinancialYear::containing(date(2025, 4, 1)).label(), "2025-26");
    BOOST_CHECK_EQUAL(fy.previous().label(), "2023-24");
    BOOST_CHECK_EQUAL(fy.next().start, date(2025, 4, 1));

    BOOST_CHECK_EQUAL(FinancialYear::starting(1999).label(), "1999-00");
}

BOOST_AUTO_TEST_CASE(testCalendarYearCompany)
{
    FinancialYear fy = FinancialYear::containing(date(2024, 7, 1), 1, 1);
    BOOST_CHECK_EQUAL(fy.label(), "2024");
    BOOST_CHECK_EQUAL(fy.end, date(2024, 12, 31));
    BOOST_CHECK_EQUAL(FinancialYear::from_label("2024", 1, 1).start, date(2024, 1, 1));
}

BOOST_AUTO_TEST_CASE(testFromLabel)
{
    FinancialYear fy = FinancialYear::from_label("2023-24");
    BOOST_CHECK_EQUAL(fy.start, date(2023, 4, 1));
    BOOST_CHECK_EQUAL(fy.end, date(2024, 3, 31));

    BOOST_CHECK_THROW(FinancialYear::from_label("2023-25"), LedgerError);
    BOOST_CHECK_THROW(FinancialYear::from_label("FY23"), LedgerError);
    BOOST_CHECK_THROW(FinancialYear::from_label("2024"), LedgerError);
    BOOST_CHECK_THROW(FinancialYear::starting(2024, 13, 1), LedgerError);
}

BOOST_AUTO_TEST_SUITE_END()
