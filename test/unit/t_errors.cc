#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE errors
#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "json_views.hpp"

using namespace ppl;

struct errors_fixture {
    LedgerError unbalanced;
    LedgerError broken;

    errors_fixture()
        : unbalanced(validation_error("UnbalancedVoucher", "Debits 1000000.00 do not equal credits 999999.98.")),
          broken(consistency_error("account 4001 non-zero after closing")) {}
};

BOOST_FIXTURE_TEST_SUITE(errors, errors_fixture)

BOOST_AUTO_TEST_CASE(testKindsMapToStatus)
{
    BOOST_CHECK_EQUAL(unbalanced.http_status(), 400);
    BOOST_CHECK_EQUAL(referential_error("UnknownAccount", "x").http_status(), 404);
    BOOST_CHECK_EQUAL(state_conflict("AlreadyClosed", "x").http_status(), 409);
    BOOST_CHECK_EQUAL(broken.http_status(), 500);
}

BOOST_AUTO_TEST_CASE(testCodes)
{
    BOOST_CHECK_EQUAL(unbalanced.code(), "UnbalancedVoucher");
    BOOST_CHECK(unbalanced.kind() == ErrorKind::Validation);
    BOOST_CHECK_EQUAL(broken.code(), "InternalInvariant");
    BOOST_CHECK(broken.kind() == ErrorKind::Consistency);
    BOOST_CHECK_EQUAL(std::string(to_string(ErrorKind::StateConflict)), "state_conflict");
}

BOOST_AUTO_TEST_CASE(testConsistencyDetailIsHidden)
{
    BOOST_CHECK_EQUAL(broken.public_message(), "internal ledger error");
    BOOST_CHECK_EQUAL(std::string(broken.what()), "account 4001 non-zero after closing");
    BOOST_CHECK_EQUAL(unbalanced.public_message(), std::string(unbalanced.what()));
}

BOOST_AUTO_TEST_CASE(testErrorBody)
{
    json body = error_body(unbalanced);
    BOOST_CHECK_EQUAL(body.at("code").get<std::string>(), "UnbalancedVoucher");
    BOOST_CHECK_EQUAL(body.at("kind").get<std::string>(), "validation");

    json hidden = error_body(broken);
    BOOST_CHECK_EQUAL(hidden.at("error").get<std::string>(), "internal ledger error");
    BOOST_CHECK(!hidden.contains("code"));
}

BOOST_AUTO_TEST_CASE(testCatchAsRuntimeError)
{
    try {
        throw state_conflict("PledgeRedeemed", "Pledge GL-0001 is already redeemed.");
    } catch (const std::runtime_error& e) {
        BOOST_CHECK_EQUAL(std::string(e.what()), "Pledge GL-0001 is already redeemed.");
    }
}

BOOST_AUTO_TEST_SUITE_END()
