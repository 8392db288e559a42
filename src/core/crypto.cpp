#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <iomanip>
#include <memory>
#include <sstream>

namespace ppl {

std::string PPLCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context ||
        EVP_DigestInit_ex(context.get(), EVP_sha256(), NULL) != 1 ||
        EVP_DigestUpdate(context.get(), str.c_str(), str.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw consistency_error("OpenSSL SHA-256 digest failed.");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string PPLCrypto::calculate_entry_hash(const std::string& prev_hash, const LedgerEntry& line) {
    std::stringstream data;
    // Narration goes last; every field before it is delimited.
    data << prev_hash << '|'
         << line.account_id << '|'
         << line.debit_amount() << '|'
         << line.credit_amount() << '|'
         << line.narration;

    return generate_sha256(data.str());
}

std::string PPLCrypto::seal_voucher(const Voucher& voucher) {
    std::string current_link = "GENESIS";

    for (const auto& line : voucher.entries) {
        current_link = calculate_entry_hash(current_link, line);
    }

    std::stringstream header;
    header << current_link << '|'
           << voucher.id << '|'
           << to_string(voucher.type) << '|'
           << format_date(voucher.voucher_date) << '|'
           << voucher.company_id;
    return generate_sha256(header.str());
}

bool PPLCrypto::verify_seal(const Voucher& voucher) {
    return !voucher.seal_hash.empty() && seal_voucher(voucher) == voucher.seal_hash;
}

} // namespace ppl
