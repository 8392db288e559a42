/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: database.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL schema and row mapping. Every loader takes the caller's open
 * transaction; none of them commits. Money columns are BIGINT micro-units.
 * ============================================================================
 */

#ifndef PPL_DATABASE_HPP
#define PPL_DATABASE_HPP

#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>

#include "balances.hpp"
#include "model.hpp"

namespace ppl {
namespace db {

    enum class RowLock { None, Share, Update };

    const std::string& schema_ddl();

    /**
     * ensure_schema
     * Creates the tables, indexes and the append-only trigger on
     * ledger_entries. Safe to run on every start.
     */
    void ensure_schema(pqxx::transaction_base& tx);

    Company load_company(pqxx::transaction_base& tx, int64_t company_id, RowLock lock = RowLock::None);

    std::vector<Account> load_accounts(pqxx::transaction_base& tx, int64_t company_id);
    Account load_account(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id);
    std::optional<Account> find_account_by_code(pqxx::transaction_base& tx, int64_t company_id, const std::string& code);

    /**
     * @brief Looks up one of the fixed accounts. A miss means the chart was
     * never initialized: LedgerError(MissingChartOfAccounts).
     */
    Account require_account_by_code(pqxx::transaction_base& tx, int64_t company_id, const std::string& code);

    Customer load_customer(pqxx::transaction_base& tx, int64_t company_id, int64_t customer_id, RowLock lock = RowLock::None);
    Scheme load_scheme(pqxx::transaction_base& tx, int64_t company_id, int64_t scheme_id);
    Pledge load_pledge(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id, RowLock lock = RowLock::None);

    Payment load_payment(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id);
    std::vector<Payment> load_payments(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id);

    Voucher load_voucher(pqxx::transaction_base& tx, int64_t company_id, int64_t voucher_id);
    std::vector<Voucher> load_vouchers(pqxx::transaction_base& tx, int64_t company_id);

    /**
     * load_entry_rows
     * Entries joined with their voucher, ordered by (voucher date, voucher
     * id, entry id). through limits voucher dates; account_id limits to one
     * account.
     */
    std::vector<EntryRow> load_entry_rows(pqxx::transaction_base& tx, int64_t company_id,
                                          std::optional<date> through = std::nullopt,
                                          std::optional<int64_t> account_id = std::nullopt);

    bool is_period_closed(pqxx::transaction_base& tx, int64_t company_id, const date& d);

    /**
     * next_sequence
     * Per-company counter for document numbers. The row stays locked until
     * the caller commits, so concurrent callers get distinct values. floor
     * is the highest number already in use; the result is always above it.
     */
    long next_sequence(pqxx::transaction_base& tx, int64_t company_id, const std::string& name, long floor = 0);

    // Vouchers dated in [from, to] that have no entries.
    int count_unposted_vouchers(pqxx::transaction_base& tx, int64_t company_id, const date& from, const date& to);

} // namespace db
} // namespace ppl

#endif // PPL_DATABASE_HPP
