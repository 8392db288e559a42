/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reversal.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Cancels a posted voucher by posting its mirror image. The original lines
 * are never edited or removed.
 * ============================================================================
 */

#ifndef PPL_REVERSAL_HPP
#define PPL_REVERSAL_HPP

#include <string>
#include <pqxx/pqxx>

#include "model.hpp"

namespace ppl {

    class ReversalEngine {
    public:
        /**
         * build_reversal
         * A journal voucher dated on_date with every line of the original,
         * same account and amount, debit and credit swapped, in the same
         * order. Lines keep the original's reference, or point back at the
         * original voucher when they had none.
         * Throws LedgerError(NothingToReverse) when the original has no lines.
         */
        static VoucherDraft build_reversal(const Voucher& original, const std::string& actor,
                                           const std::string& reason, const date& on_date);

        /**
         * reverse
         * Loads the voucher, refuses closing/opening vouchers, reversal
         * vouchers and vouchers already reversed, then posts the mirror.
         */
        static Voucher reverse(pqxx::transaction_base& tx, int64_t company_id, int64_t voucher_id,
                               const std::string& actor, const std::string& reason, const date& on_date);
    };

} // namespace ppl

#endif // PPL_REVERSAL_HPP
