#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE crypto
#include <boost/test/unit_test.hpp>

#include "crypto.hpp"

using namespace ppl;

struct crypto_fixture {
    Voucher voucher;

    crypto_fixture() {
        voucher.id = 42;
        voucher.company_id = 1;
        voucher.type = VoucherType::Receipt;
        voucher.voucher_date = date(2024, 2, 15);

        LedgerEntry cash;
        cash.account_id = 1001;
        cash.direction = Direction::Debit;
        cash.amount = units(2000);
        cash.narration = "Interest received";

        LedgerEntry income = cash;
        income.account_id = 4001;
        income.direction = Direction::Credit;

        voucher.entries.push_back(cash);
        voucher.entries.push_back(income);
        voucher.seal_hash = PPLCrypto::seal_voucher(voucher);
    }
};

BOOST_FIXTURE_TEST_SUITE(crypto, crypto_fixture)

BOOST_AUTO_TEST_CASE(testSha256)
{
    BOOST_CHECK_EQUAL(PPLCrypto::generate_sha256("abc"),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(PPLCrypto::generate_sha256(""),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(testSealVerifies)
{
    BOOST_CHECK_EQUAL(voucher.seal_hash.size(), 64u);
    BOOST_CHECK(PPLCrypto::verify_seal(voucher));
}

BOOST_AUTO_TEST_CASE(testTamperedAmountBreaksSeal)
{
    voucher.entries[1].amount = units(200);
    BOOST_CHECK(!PPLCrypto::verify_seal(voucher));
}

BOOST_AUTO_TEST_CASE(testReorderedLinesBreakSeal)
{
    std::swap(voucher.entries[0], voucher.entries[1]);
    BOOST_CHECK(!PPLCrypto::verify_seal(voucher));
}

BOOST_AUTO_TEST_CASE(testHeaderIsSealed)
{
    voucher.voucher_date = date(2024, 2, 16);
    BOOST_CHECK(!PPLCrypto::verify_seal(voucher));
}

BOOST_AUTO_TEST_CASE(testEntryFieldsAreDelimited)
{
    LedgerEntry first;
    first.account_id = 1;
    first.direction = Direction::Debit;
    first.amount = 23;
    first.narration = "cash";

    LedgerEntry second = first;
    second.account_id = 12;
    second.amount = 3;

    BOOST_CHECK_NE(PPLCrypto::calculate_entry_hash("GENESIS", first),
                   PPLCrypto::calculate_entry_hash("GENESIS", second));
}

BOOST_AUTO_TEST_CASE(testUnsealedNeverVerifies)
{
    voucher.seal_hash.clear();
    BOOST_CHECK(!PPLCrypto::verify_seal(voucher));
}

BOOST_AUTO_TEST_SUITE_END()
