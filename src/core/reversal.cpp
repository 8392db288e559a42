/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reversal.cpp
 * ============================================================================
 */

#include "reversal.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "posting.hpp"

namespace ppl {

VoucherDraft ReversalEngine::build_reversal(const Voucher& original, const std::string& actor,
                                            const std::string& reason, const date& on_date) {
    if (original.entries.empty()) {
        throw state_conflict("NothingToReverse", "Voucher #" + std::to_string(original.id) + " has no entries.");
    }

    std::string narration = "Reversal of voucher #" + std::to_string(original.id);
    if (!reason.empty()) narration += ": " + reason;

    VoucherDraft draft = make_voucher(original.company_id, VoucherType::Journal, on_date, narration, actor);
    draft.reverses_voucher_id = original.id;

    for (const auto& line : original.entries) {
        std::optional<Reference> ref = line.reference;
        if (!ref) ref = Reference{"voucher", original.id};

        std::string line_narration = "Reversal: " + line.narration;
        if (line.direction == Direction::Debit) {
            draft.entries.push_back(credit(line.account_id, line.amount, line_narration, ref));
        } else {
            draft.entries.push_back(debit(line.account_id, line.amount, line_narration, ref));
        }
    }
    return draft;
}

Voucher ReversalEngine::reverse(pqxx::transaction_base& tx, int64_t company_id, int64_t voucher_id,
                                const std::string& actor, const std::string& reason, const date& on_date) {
    Voucher original = db::load_voucher(tx, company_id, voucher_id);

    if (is_reserved(original.type)) {
        throw validation_error("ReservedVoucherType",
                               "A " + to_string(original.type) + " voucher cannot be reversed.");
    }
    if (original.reverses_voucher_id) {
        throw state_conflict("AlreadyReversed",
                             "Voucher #" + std::to_string(voucher_id) + " is itself a reversal.");
    }
    pqxx::result existing = tx.exec_params("SELECT id FROM vouchers WHERE reverses_voucher_id = $1", voucher_id);
    if (!existing.empty()) {
        throw state_conflict("AlreadyReversed",
                             "Voucher #" + std::to_string(voucher_id) + " was already reversed by voucher #" +
                             existing[0][0].as<std::string>() + ".");
    }

    Voucher mirror = PostingEngine::post(tx, build_reversal(original, actor, reason, on_date));

    if (mirror.total_debit() != original.total_credit() || mirror.total_credit() != original.total_debit() ||
        mirror.entries.size() != original.entries.size()) {
        ppl_log("ERROR", "Reversal of voucher #" + std::to_string(voucher_id) + " produced mismatched totals: " +
                         format_money(mirror.total_debit()) + "/" + format_money(mirror.total_credit()) + " against " +
                         format_money(original.total_debit()) + "/" + format_money(original.total_credit()) + ".");
        throw consistency_error("Reversal totals do not mirror voucher #" + std::to_string(voucher_id) + ".");
    }

    ppl_log("INFO", "Voucher #" + std::to_string(voucher_id) + " reversed by voucher #" + std::to_string(mirror.id) +
                    " (actor " + actor + ").");
    return mirror;
}

} // namespace ppl
