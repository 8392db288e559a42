/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: posting.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The only writer of vouchers and ledger entries. A voucher and its lines
 * go into the caller's transaction together, so a failure anywhere before
 * commit leaves nothing behind.
 * ============================================================================
 */

#ifndef PPL_POSTING_HPP
#define PPL_POSTING_HPP

#include <pqxx/pqxx>

#include "model.hpp"

namespace ppl {

    struct PostingTotals {
        money_micro debit = 0;
        money_micro credit = 0;
    };

    class PostingEngine {
    public:
        /**
         * validate_voucher
         * The fundamental rule: at least one line, every amount positive and
         * in whole cents, debits equal credits within kTolerance.
         * Throws LedgerError(EmptyVoucher | NonPositiveAmount | InvalidAmount
         * | UnbalancedVoucher).
         */
        static PostingTotals validate_voucher(const VoucherDraft& draft);

        /**
         * post
         * Validates, checks every account belongs to the company and is
         * active, refuses dates inside a closed financial year, then writes
         * the voucher, its lines in order, and the voucher seal.
         */
        static Voucher post(pqxx::transaction_base& tx, const VoucherDraft& draft);

        /**
         * post_journal
         * post() for callers outside the engine. Closing and opening voucher
         * types are refused with LedgerError(ReservedVoucherType).
         */
        static Voucher post_journal(pqxx::transaction_base& tx, const VoucherDraft& draft);
    };

} // namespace ppl

#endif // PPL_POSTING_HPP
