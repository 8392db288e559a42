/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: database.cpp
 * ============================================================================
 */

#include "database.hpp"
#include "errors.hpp"

#include <map>

namespace ppl {
namespace db {

namespace {

const char* lock_clause(RowLock lock) {
    switch (lock) {
        case RowLock::Share: return " FOR SHARE";
        case RowLock::Update: return " FOR UPDATE";
        case RowLock::None: break;
    }
    return "";
}

std::optional<int64_t> optional_id(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<int64_t>();
}

std::string text_or_empty(const pqxx::field& field) {
    return field.is_null() ? "" : field.as<std::string>();
}

const char* kAccountColumns = "SELECT id, company_id, code, name, account_type, parent_id, is_active FROM accounts ";

Account row_to_account(const pqxx::row& row) {
    Account a;
    a.id = row[0].as<int64_t>();
    a.company_id = row[1].as<int64_t>();
    a.code = row[2].as<std::string>();
    a.name = row[3].as<std::string>();
    a.type = parse_account_type(row[4].as<std::string>());
    a.parent_id = optional_id(row[5]);
    a.active = row[6].as<bool>();
    return a;
}

const char* kPaymentColumns =
    "SELECT id, company_id, pledge_id, payment_kind, to_char(payment_date, 'YYYY-MM-DD'), "
    "to_char(created_at::date, 'YYYY-MM-DD'), amount_micros, interest_micros, principal_micros, "
    "penalty_micros, discount_micros, balance_amount_micros, method, receipt_no, remarks, "
    "voucher_id, created_by FROM payments ";

Payment row_to_payment(const pqxx::row& row) {
    Payment p;
    p.id = row[0].as<int64_t>();
    p.company_id = row[1].as<int64_t>();
    p.pledge_id = row[2].as<int64_t>();
    p.kind = parse_payment_kind(row[3].as<std::string>());
    p.payment_date = parse_date(row[4].as<std::string>());
    p.created_on = parse_date(row[5].as<std::string>());
    p.amount = row[6].as<int64_t>();
    p.interest = row[7].as<int64_t>();
    p.principal = row[8].as<int64_t>();
    p.penalty = row[9].as<int64_t>();
    p.discount = row[10].as<int64_t>();
    p.balance_amount = row[11].as<int64_t>();
    p.method = row[12].as<std::string>();
    p.receipt_no = row[13].as<std::string>();
    p.remarks = text_or_empty(row[14]);
    p.voucher_id = optional_id(row[15]);
    p.created_by = row[16].as<std::string>();
    return p;
}

const char* kVoucherColumns =
    "SELECT id, company_id, voucher_type, to_char(voucher_date, 'YYYY-MM-DD'), narration, created_by, "
    "to_char(created_at, 'YYYY-MM-DD\"T\"HH24:MI:SS'), fiscal_year, reverses_voucher_id, seal_hash FROM vouchers ";

Voucher row_to_voucher(const pqxx::row& row) {
    Voucher v;
    v.id = row[0].as<int64_t>();
    v.company_id = row[1].as<int64_t>();
    v.type = parse_voucher_type(row[2].as<std::string>());
    v.voucher_date = parse_date(row[3].as<std::string>());
    v.narration = row[4].as<std::string>();
    v.created_by = row[5].as<std::string>();
    v.created_at = row[6].as<std::string>();
    v.fiscal_year = row[7].as<std::string>();
    v.reverses_voucher_id = optional_id(row[8]);
    v.seal_hash = row[9].as<std::string>();
    return v;
}

const char* kEntryColumns =
    "SELECT id, voucher_id, company_id, account_id, dr_cr, amount_micros, narration, reference_kind, "
    "reference_id, to_char(transaction_date, 'YYYY-MM-DD') FROM ledger_entries ";

LedgerEntry row_to_entry(const pqxx::row& row) {
    LedgerEntry e;
    e.id = row[0].as<int64_t>();
    e.voucher_id = row[1].as<int64_t>();
    e.company_id = row[2].as<int64_t>();
    e.account_id = row[3].as<int64_t>();
    e.direction = parse_direction(row[4].as<std::string>());
    e.amount = row[5].as<int64_t>();
    e.narration = row[6].as<std::string>();
    if (!row[7].is_null()) e.reference = Reference{row[7].as<std::string>(), row[8].as<int64_t>()};
    e.transaction_date = parse_date(row[9].as<std::string>());
    return e;
}

} // namespace

const std::string& schema_ddl() {
    static const std::string ddl = R"SQL(
CREATE TABLE IF NOT EXISTS companies (
    id BIGSERIAL PRIMARY KEY,
    code TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL,
    fiscal_start_month INTEGER NOT NULL DEFAULT 4 CHECK (fiscal_start_month BETWEEN 1 AND 12),
    fiscal_start_day INTEGER NOT NULL DEFAULT 1 CHECK (fiscal_start_day BETWEEN 1 AND 31),
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS accounts (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    code TEXT NOT NULL,
    name TEXT NOT NULL,
    account_type TEXT NOT NULL CHECK (account_type IN ('Asset', 'Liability', 'Income', 'Expense', 'Equity')),
    parent_id BIGINT REFERENCES accounts(id),
    is_active BOOLEAN NOT NULL DEFAULT TRUE,
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (company_id, code)
);

CREATE TABLE IF NOT EXISTS customers (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    name TEXT NOT NULL,
    coa_account_id BIGINT UNIQUE REFERENCES accounts(id),
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS schemes (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    name TEXT NOT NULL,
    prefix TEXT NOT NULL DEFAULT 'PL',
    monthly_rate_ppm BIGINT NOT NULL CHECK (monthly_rate_ppm >= 0),
    duration_months INTEGER NOT NULL DEFAULT 12 CHECK (duration_months > 0)
);

CREATE TABLE IF NOT EXISTS vouchers (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    voucher_type TEXT NOT NULL CHECK (voucher_type IN ('loan_disbursal', 'receipt', 'payment', 'journal',
                                                       'auction', 'year_end_closing', 'year_opening')),
    voucher_date DATE NOT NULL,
    narration TEXT NOT NULL DEFAULT '',
    created_by TEXT NOT NULL,
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
    fiscal_year TEXT NOT NULL DEFAULT '',
    reverses_voucher_id BIGINT UNIQUE REFERENCES vouchers(id),
    seal_hash TEXT NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS ix_vouchers_company_date ON vouchers (company_id, voucher_date, id);

CREATE TABLE IF NOT EXISTS ledger_entries (
    id BIGSERIAL PRIMARY KEY,
    voucher_id BIGINT NOT NULL REFERENCES vouchers(id),
    company_id BIGINT NOT NULL REFERENCES companies(id),
    account_id BIGINT NOT NULL REFERENCES accounts(id),
    dr_cr CHAR(1) NOT NULL CHECK (dr_cr IN ('D', 'C')),
    amount_micros BIGINT NOT NULL CHECK (amount_micros > 0),
    narration TEXT NOT NULL DEFAULT '',
    reference_kind TEXT,
    reference_id BIGINT,
    transaction_date DATE NOT NULL,
    CHECK ((reference_kind IS NULL) = (reference_id IS NULL))
);

CREATE INDEX IF NOT EXISTS ix_entries_voucher ON ledger_entries (voucher_id, id);
CREATE INDEX IF NOT EXISTS ix_entries_company_account ON ledger_entries (company_id, account_id);

CREATE OR REPLACE FUNCTION ppl_entries_append_only() RETURNS trigger AS $$
BEGIN
    RAISE EXCEPTION 'ledger_entries is append-only; post a reversal instead';
END;
$$ LANGUAGE plpgsql;

DROP TRIGGER IF EXISTS trg_entries_append_only ON ledger_entries;
CREATE TRIGGER trg_entries_append_only BEFORE UPDATE OR DELETE ON ledger_entries
    FOR EACH ROW EXECUTE PROCEDURE ppl_entries_append_only();

CREATE TABLE IF NOT EXISTS pledges (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    customer_id BIGINT NOT NULL REFERENCES customers(id),
    scheme_id BIGINT NOT NULL REFERENCES schemes(id),
    pledge_no TEXT NOT NULL,
    principal_micros BIGINT NOT NULL CHECK (principal_micros > 0),
    first_month_interest_micros BIGINT NOT NULL CHECK (first_month_interest_micros >= 0),
    document_charges_micros BIGINT NOT NULL CHECK (document_charges_micros >= 0),
    final_amount_micros BIGINT NOT NULL,
    monthly_rate_ppm BIGINT NOT NULL,
    status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active', 'partial_paid', 'redeemed')),
    pledge_date DATE NOT NULL,
    due_date DATE NOT NULL,
    voucher_id BIGINT REFERENCES vouchers(id),
    created_by TEXT NOT NULL,
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (company_id, pledge_no),
    CHECK (final_amount_micros = principal_micros + first_month_interest_micros + document_charges_micros)
);

CREATE TABLE IF NOT EXISTS payments (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    pledge_id BIGINT NOT NULL REFERENCES pledges(id) ON DELETE CASCADE,
    payment_kind TEXT NOT NULL CHECK (payment_kind IN ('first_interest', 'regular')),
    payment_date DATE NOT NULL,
    amount_micros BIGINT NOT NULL CHECK (amount_micros > 0),
    interest_micros BIGINT NOT NULL DEFAULT 0 CHECK (interest_micros >= 0),
    principal_micros BIGINT NOT NULL DEFAULT 0 CHECK (principal_micros >= 0),
    penalty_micros BIGINT NOT NULL DEFAULT 0 CHECK (penalty_micros >= 0),
    discount_micros BIGINT NOT NULL DEFAULT 0 CHECK (discount_micros >= 0),
    balance_amount_micros BIGINT NOT NULL DEFAULT 0,
    method TEXT NOT NULL DEFAULT 'cash',
    receipt_no TEXT NOT NULL UNIQUE,
    remarks TEXT,
    voucher_id BIGINT REFERENCES vouchers(id),
    created_by TEXT NOT NULL,
    created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
    CHECK (amount_micros = interest_micros + principal_micros + penalty_micros)
);

CREATE INDEX IF NOT EXISTS ix_payments_pledge ON payments (pledge_id, payment_date, id);

CREATE TABLE IF NOT EXISTS fiscal_years (
    id BIGSERIAL PRIMARY KEY,
    company_id BIGINT NOT NULL REFERENCES companies(id),
    label TEXT NOT NULL,
    start_date DATE NOT NULL,
    end_date DATE NOT NULL,
    closed BOOLEAN NOT NULL DEFAULT FALSE,
    closing_voucher_id BIGINT REFERENCES vouchers(id),
    closed_by TEXT,
    closed_at TIMESTAMPTZ,
    opened BOOLEAN NOT NULL DEFAULT FALSE,
    opening_voucher_id BIGINT REFERENCES vouchers(id),
    opened_by TEXT,
    opened_at TIMESTAMPTZ,
    UNIQUE (company_id, label)
);

CREATE TABLE IF NOT EXISTS number_sequences (
    company_id BIGINT NOT NULL REFERENCES companies(id),
    name TEXT NOT NULL,
    last_value BIGINT NOT NULL,
    PRIMARY KEY (company_id, name)
);
)SQL";
    return ddl;
}

void ensure_schema(pqxx::transaction_base& tx) {
    tx.exec(schema_ddl());
}

Company load_company(pqxx::transaction_base& tx, int64_t company_id, RowLock lock) {
    pqxx::result r = tx.exec_params(
        std::string("SELECT id, code, name, fiscal_start_month, fiscal_start_day FROM companies WHERE id = $1") + lock_clause(lock),
        company_id);
    if (r.empty()) {
        throw referential_error("UnknownCompany", "Company " + std::to_string(company_id) + " does not exist.");
    }

    Company c;
    c.id = r[0][0].as<int64_t>();
    c.code = r[0][1].as<std::string>();
    c.name = r[0][2].as<std::string>();
    c.fiscal_start_month = r[0][3].as<int>();
    c.fiscal_start_day = r[0][4].as<int>();
    return c;
}

std::vector<Account> load_accounts(pqxx::transaction_base& tx, int64_t company_id) {
    pqxx::result r = tx.exec_params(std::string(kAccountColumns) + "WHERE company_id = $1 ORDER BY code", company_id);
    std::vector<Account> accounts;
    for (const auto& row : r) accounts.push_back(row_to_account(row));
    return accounts;
}

Account load_account(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id) {
    pqxx::result r = tx.exec_params(std::string(kAccountColumns) + "WHERE company_id = $1 AND id = $2", company_id, account_id);
    if (r.empty()) {
        throw referential_error("UnknownAccount", "Account " + std::to_string(account_id) + " does not exist in this company.");
    }
    return row_to_account(r[0]);
}

std::optional<Account> find_account_by_code(pqxx::transaction_base& tx, int64_t company_id, const std::string& code) {
    pqxx::result r = tx.exec_params(std::string(kAccountColumns) + "WHERE company_id = $1 AND code = $2", company_id, code);
    if (r.empty()) return std::nullopt;
    return row_to_account(r[0]);
}

Account require_account_by_code(pqxx::transaction_base& tx, int64_t company_id, const std::string& code) {
    std::optional<Account> account = find_account_by_code(tx, company_id, code);
    if (!account) {
        throw referential_error("MissingChartOfAccounts",
                                "Account " + code + " not found. Initialize the chart of accounts first.");
    }
    return *account;
}

Customer load_customer(pqxx::transaction_base& tx, int64_t company_id, int64_t customer_id, RowLock lock) {
    pqxx::result r = tx.exec_params(
        std::string("SELECT id, company_id, name, coa_account_id FROM customers WHERE company_id = $1 AND id = $2") + lock_clause(lock),
        company_id, customer_id);
    if (r.empty()) {
        throw referential_error("UnknownCustomer", "Customer " + std::to_string(customer_id) + " does not exist in this company.");
    }

    Customer c;
    c.id = r[0][0].as<int64_t>();
    c.company_id = r[0][1].as<int64_t>();
    c.name = r[0][2].as<std::string>();
    c.coa_account_id = optional_id(r[0][3]);
    return c;
}

Scheme load_scheme(pqxx::transaction_base& tx, int64_t company_id, int64_t scheme_id) {
    pqxx::result r = tx.exec_params(
        "SELECT id, company_id, name, prefix, monthly_rate_ppm, duration_months FROM schemes WHERE company_id = $1 AND id = $2",
        company_id, scheme_id);
    if (r.empty()) {
        throw referential_error("UnknownScheme", "Scheme " + std::to_string(scheme_id) + " does not exist in this company.");
    }

    Scheme s;
    s.id = r[0][0].as<int64_t>();
    s.company_id = r[0][1].as<int64_t>();
    s.name = r[0][2].as<std::string>();
    s.prefix = r[0][3].as<std::string>();
    s.monthly_rate = r[0][4].as<int64_t>();
    s.duration_months = r[0][5].as<int>();
    return s;
}

Pledge load_pledge(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id, RowLock lock) {
    pqxx::result r = tx.exec_params(
        std::string("SELECT id, company_id, customer_id, scheme_id, pledge_no, principal_micros, first_month_interest_micros, "
                    "document_charges_micros, final_amount_micros, monthly_rate_ppm, status, "
                    "to_char(pledge_date, 'YYYY-MM-DD'), to_char(due_date, 'YYYY-MM-DD'), voucher_id "
                    "FROM pledges WHERE company_id = $1 AND id = $2") + lock_clause(lock),
        company_id, pledge_id);
    if (r.empty()) {
        throw referential_error("UnknownPledge", "Pledge " + std::to_string(pledge_id) + " does not exist in this company.");
    }

    const pqxx::row row = r[0];
    Pledge p;
    p.id = row[0].as<int64_t>();
    p.company_id = row[1].as<int64_t>();
    p.customer_id = row[2].as<int64_t>();
    p.scheme_id = row[3].as<int64_t>();
    p.pledge_no = row[4].as<std::string>();
    p.principal = row[5].as<int64_t>();
    p.first_month_interest = row[6].as<int64_t>();
    p.document_charges = row[7].as<int64_t>();
    p.final_amount = row[8].as<int64_t>();
    p.monthly_rate = row[9].as<int64_t>();
    p.status = parse_pledge_status(row[10].as<std::string>());
    p.pledge_date = parse_date(row[11].as<std::string>());
    p.due_date = parse_date(row[12].as<std::string>());
    p.voucher_id = optional_id(row[13]);
    return p;
}

Payment load_payment(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id) {
    pqxx::result r = tx.exec_params(std::string(kPaymentColumns) + "WHERE company_id = $1 AND id = $2", company_id, payment_id);
    if (r.empty()) {
        throw referential_error("UnknownPayment", "Payment " + std::to_string(payment_id) + " does not exist in this company.");
    }
    return row_to_payment(r[0]);
}

std::vector<Payment> load_payments(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id) {
    pqxx::result r = tx.exec_params(
        std::string(kPaymentColumns) + "WHERE company_id = $1 AND pledge_id = $2 ORDER BY payment_date, id",
        company_id, pledge_id);
    std::vector<Payment> payments;
    for (const auto& row : r) payments.push_back(row_to_payment(row));
    return payments;
}

Voucher load_voucher(pqxx::transaction_base& tx, int64_t company_id, int64_t voucher_id) {
    pqxx::result r = tx.exec_params(std::string(kVoucherColumns) + "WHERE company_id = $1 AND id = $2", company_id, voucher_id);
    if (r.empty()) {
        throw referential_error("UnknownVoucher", "Voucher " + std::to_string(voucher_id) + " does not exist in this company.");
    }

    Voucher v = row_to_voucher(r[0]);
    pqxx::result lines = tx.exec_params(std::string(kEntryColumns) + "WHERE company_id = $1 AND voucher_id = $2 ORDER BY id",
                                        company_id, voucher_id);
    for (const auto& row : lines) v.entries.push_back(row_to_entry(row));
    return v;
}

std::vector<Voucher> load_vouchers(pqxx::transaction_base& tx, int64_t company_id) {
    pqxx::result r = tx.exec_params(std::string(kVoucherColumns) + "WHERE company_id = $1 ORDER BY id", company_id);

    std::vector<Voucher> vouchers;
    std::map<int64_t, std::size_t> position;
    for (const auto& row : r) {
        position[row[0].as<int64_t>()] = vouchers.size();
        vouchers.push_back(row_to_voucher(row));
    }

    pqxx::result lines = tx.exec_params(std::string(kEntryColumns) + "WHERE company_id = $1 ORDER BY voucher_id, id", company_id);
    for (const auto& row : lines) {
        LedgerEntry e = row_to_entry(row);
        auto it = position.find(e.voucher_id);
        if (it != position.end()) vouchers[it->second].entries.push_back(e);
    }
    return vouchers;
}

std::vector<EntryRow> load_entry_rows(pqxx::transaction_base& tx, int64_t company_id,
                                      std::optional<date> through, std::optional<int64_t> account_id) {
    std::optional<std::string> through_text;
    if (through) through_text = format_date(*through);

    pqxx::result r = tx.exec_params(
        "SELECT e.id, e.voucher_id, e.account_id, v.voucher_type, to_char(v.voucher_date, 'YYYY-MM-DD'), "
        "e.dr_cr, e.amount_micros, e.narration, v.narration, e.reference_kind, e.reference_id "
        "FROM ledger_entries e JOIN vouchers v ON v.id = e.voucher_id "
        "WHERE e.company_id = $1 AND v.company_id = $1 "
        "AND ($2::date IS NULL OR v.voucher_date <= $2::date) "
        "AND ($3::bigint IS NULL OR e.account_id = $3::bigint) "
        "ORDER BY v.voucher_date, v.id, e.id",
        company_id, through_text, account_id);

    std::vector<EntryRow> rows;
    rows.reserve(r.size());
    for (const auto& row : r) {
        EntryRow e;
        e.entry_id = row[0].as<int64_t>();
        e.voucher_id = row[1].as<int64_t>();
        e.account_id = row[2].as<int64_t>();
        e.voucher_type = parse_voucher_type(row[3].as<std::string>());
        e.voucher_date = parse_date(row[4].as<std::string>());
        e.direction = parse_direction(row[5].as<std::string>());
        e.amount = row[6].as<int64_t>();
        e.narration = row[7].as<std::string>();
        e.voucher_narration = row[8].as<std::string>();
        if (!row[9].is_null()) e.reference = Reference{row[9].as<std::string>(), row[10].as<int64_t>()};
        rows.push_back(e);
    }
    return rows;
}

bool is_period_closed(pqxx::transaction_base& tx, int64_t company_id, const date& d) {
    pqxx::row r = tx.exec_params1(
        "SELECT EXISTS (SELECT 1 FROM fiscal_years WHERE company_id = $1 AND closed "
        "AND $2::date BETWEEN start_date AND end_date)",
        company_id, format_date(d));
    return r[0].as<bool>();
}

long next_sequence(pqxx::transaction_base& tx, int64_t company_id, const std::string& name, long floor) {
    pqxx::row r = tx.exec_params1(
        "INSERT INTO number_sequences (company_id, name, last_value) VALUES ($1, $2, $3::bigint + 1) "
        "ON CONFLICT (company_id, name) DO UPDATE "
        "SET last_value = GREATEST(number_sequences.last_value, $3::bigint) + 1 "
        "RETURNING last_value",
        company_id, name, static_cast<int64_t>(floor));
    return r[0].as<long>();
}

int count_unposted_vouchers(pqxx::transaction_base& tx, int64_t company_id, const date& from, const date& to) {
    pqxx::row r = tx.exec_params1(
        "SELECT count(*) FROM vouchers v WHERE v.company_id = $1 "
        "AND v.voucher_date BETWEEN $2::date AND $3::date "
        "AND NOT EXISTS (SELECT 1 FROM ledger_entries e WHERE e.voucher_id = v.id)",
        company_id, format_date(from), format_date(to));
    return r[0].as<int>();
}

} // namespace db
} // namespace ppl
