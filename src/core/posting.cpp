/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: posting.cpp
 * ============================================================================
 */

#include "posting.hpp"
#include "crypto.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <map>

namespace ppl {

PostingTotals PostingEngine::validate_voucher(const VoucherDraft& draft) {
    // An empty transaction is logically invalid
    if (draft.entries.empty()) {
        throw validation_error("EmptyVoucher", "Voucher must have at least one entry.");
    }

    PostingTotals totals;
    for (const auto& line : draft.entries) {
        if (line.amount <= 0) {
            throw validation_error("NonPositiveAmount",
                                   "Entry amount must be positive, got " + format_money(line.amount) + ".");
        }
        if (!is_whole_cents(line.amount)) {
            throw validation_error("InvalidAmount", "Entry amount must be in whole cents.");
        }
        if (line.amount > kMaxAmount) {
            throw validation_error("InvalidAmount", "Entry amount " + format_money(line.amount) + " out of range.");
        }
        if (line.direction == Direction::Debit) totals.debit = checked_add(totals.debit, line.amount);
        else totals.credit = checked_add(totals.credit, line.amount);
    }

    if (!within_tolerance(totals.debit, totals.credit)) {
        ppl_log("WARN", "Voucher unbalanced! Debits " + format_money(totals.debit) +
                        " vs credits " + format_money(totals.credit) + ".");
        throw validation_error("UnbalancedVoucher",
                               "Debits " + format_money(totals.debit) + " do not equal credits " +
                               format_money(totals.credit) + ".");
    }
    return totals;
}

Voucher PostingEngine::post(pqxx::transaction_base& tx, const VoucherDraft& draft) {
    validate_voucher(draft);
    // Shared with other postings, exclusive against a year close or open.
    Company company = db::load_company(tx, draft.company_id, db::RowLock::Share);

    // Closing, opening and reversal vouchers may still touch deactivated accounts.
    bool allow_inactive = is_reserved(draft.type) || draft.reverses_voucher_id.has_value();

    std::map<int64_t, Account> touched;
    for (const auto& line : draft.entries) {
        if (touched.count(line.account_id)) continue;
        Account account = db::load_account(tx, draft.company_id, line.account_id);
        if (!account.active && !allow_inactive) {
            throw referential_error("AccountInactive", "Account " + account.code + " is deactivated.");
        }
        touched[account.id] = account;
    }

    if (db::is_period_closed(tx, draft.company_id, draft.voucher_date)) {
        throw state_conflict("PeriodClosed",
                             "The financial year containing " + format_date(draft.voucher_date) + " is closed.");
    }

    const std::string voucher_date = format_date(draft.voucher_date);
    const std::string fiscal_year = draft.fiscal_year.empty()
        ? FinancialYear::containing(draft.voucher_date, company.fiscal_start_month, company.fiscal_start_day).label()
        : draft.fiscal_year;
    pqxx::row header = tx.exec_params1(
        "INSERT INTO vouchers (company_id, voucher_type, voucher_date, narration, created_by, fiscal_year, reverses_voucher_id) "
        "VALUES ($1, $2, $3::date, $4, $5, $6, $7) "
        "RETURNING id, to_char(created_at, 'YYYY-MM-DD\"T\"HH24:MI:SS')",
        draft.company_id, to_string(draft.type), voucher_date, draft.narration, draft.actor,
        fiscal_year, draft.reverses_voucher_id);

    Voucher voucher;
    voucher.id = header[0].as<int64_t>();
    voucher.created_at = header[1].as<std::string>();
    voucher.company_id = draft.company_id;
    voucher.type = draft.type;
    voucher.voucher_date = draft.voucher_date;
    voucher.narration = draft.narration;
    voucher.created_by = draft.actor;
    voucher.fiscal_year = fiscal_year;
    voucher.reverses_voucher_id = draft.reverses_voucher_id;

    for (const auto& line : draft.entries) {
        std::optional<std::string> ref_kind;
        std::optional<int64_t> ref_id;
        if (line.reference) {
            ref_kind = line.reference->kind;
            ref_id = line.reference->id;
        }

        pqxx::row inserted = tx.exec_params1(
            "INSERT INTO ledger_entries (voucher_id, company_id, account_id, dr_cr, amount_micros, narration, "
            "reference_kind, reference_id, transaction_date) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::date) RETURNING id",
            voucher.id, draft.company_id, line.account_id, to_string(line.direction), line.amount,
            line.narration, ref_kind, ref_id, voucher_date);

        LedgerEntry entry;
        entry.id = inserted[0].as<int64_t>();
        entry.voucher_id = voucher.id;
        entry.company_id = draft.company_id;
        entry.account_id = line.account_id;
        entry.direction = line.direction;
        entry.amount = line.amount;
        entry.narration = line.narration;
        entry.reference = line.reference;
        entry.transaction_date = draft.voucher_date;
        voucher.entries.push_back(entry);
    }

    voucher.seal_hash = PPLCrypto::seal_voucher(voucher);
    tx.exec_params0("UPDATE vouchers SET seal_hash = $1 WHERE id = $2", voucher.seal_hash, voucher.id);

    ppl_log("INFO", "Voucher #" + std::to_string(voucher.id) + " (" + to_string(voucher.type) + ") posted for company " +
                    std::to_string(voucher.company_id) + " with " + std::to_string(voucher.entries.size()) + " entries.");
    return voucher;
}

Voucher PostingEngine::post_journal(pqxx::transaction_base& tx, const VoucherDraft& draft) {
    if (is_reserved(draft.type)) {
        throw validation_error("ReservedVoucherType",
                               to_string(draft.type) + " vouchers are posted only by the financial year close/open.");
    }
    if (draft.reverses_voucher_id) {
        throw validation_error("InvalidArgument", "Use the reversal operation to reverse a voucher.");
    }
    return post(tx, draft);
}

} // namespace ppl
