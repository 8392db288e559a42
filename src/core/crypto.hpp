/**
 * PawnPro Ledger - Cryptographic Module Header
 * Purpose: SHA-256 seals that bond each voucher's lines together.
 */

#ifndef PPL_CRYPTO_HPP
#define PPL_CRYPTO_HPP

#include <string>
#include "model.hpp"

namespace ppl {

class PPLCrypto {
public:
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_entry_hash
     * Folds one ledger line into the running hash of its voucher.
     */
    static std::string calculate_entry_hash(const std::string& prev_hash, const LedgerEntry& line);

    /**
     * seal_voucher
     * Chains every line of the voucher from "GENESIS" in entry order, then
     * bonds the header (id, type, date, company) to the result.
     */
    static std::string seal_voucher(const Voucher& voucher);

    static bool verify_seal(const Voucher& voucher);
};

} // namespace ppl

#endif
