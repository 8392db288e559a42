/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_views.cpp
 * ============================================================================
 */

#include "json_views.hpp"
#include "money.hpp"

namespace ppl {

namespace {

json optional_id(const std::optional<int64_t>& id) {
    return id ? json(*id) : json(nullptr);
}

json reference_json(const std::optional<Reference>& ref) {
    if (!ref) return nullptr;
    return {{"kind", ref->kind}, {"id", ref->id}};
}

json statement_lines(const std::vector<StatementLine>& lines) {
    json out = json::array();
    for (const auto& line : lines) {
        out.push_back({
            {"account_id", line.account_id},
            {"code", line.code},
            {"name", line.name},
            {"amount", format_money(line.amount)}
        });
    }
    return out;
}

std::string string_field(const json& body, const char* key, const std::string& fallback = "") {
    if (!body.contains(key) || body.at(key).is_null()) return fallback;
    if (!body.at(key).is_string()) {
        throw validation_error("InvalidArgument", std::string("Field '") + key + "' must be a string.");
    }
    return body.at(key).get<std::string>();
}

int64_t id_field(const json& body, const char* key) {
    if (!body.contains(key) || !body.at(key).is_number_integer()) {
        throw validation_error("InvalidArgument", std::string("Field '") + key + "' must be an integer id.");
    }
    return body.at(key).get<int64_t>();
}

date date_field(const json& body, const char* key) {
    if (!body.contains(key) || body.at(key).is_null()) return today();
    return parse_date(string_field(body, key));
}

} // namespace

void to_json(json& j, const Account& a) {
    j = {
        {"id", a.id},
        {"company_id", a.company_id},
        {"code", a.code},
        {"name", a.name},
        {"account_type", to_string(a.type)},
        {"parent_id", optional_id(a.parent_id)},
        {"is_active", a.active}
    };
}

void to_json(json& j, const LedgerEntry& e) {
    j = {
        {"id", e.id},
        {"account_id", e.account_id},
        {"dr_cr", to_string(e.direction)},
        {"debit", format_money(e.debit_amount())},
        {"credit", format_money(e.credit_amount())},
        {"narration", e.narration},
        {"reference", reference_json(e.reference)},
        {"transaction_date", format_date(e.transaction_date)}
    };
}

void to_json(json& j, const Voucher& v) {
    j = {
        {"id", v.id},
        {"company_id", v.company_id},
        {"voucher_type", to_string(v.type)},
        {"voucher_date", format_date(v.voucher_date)},
        {"narration", v.narration},
        {"created_by", v.created_by},
        {"created_at", v.created_at},
        {"fiscal_year", v.fiscal_year},
        {"reverses_voucher_id", optional_id(v.reverses_voucher_id)},
        {"seal_hash", v.seal_hash},
        {"total_debit", format_money(v.total_debit())},
        {"total_credit", format_money(v.total_credit())},
        {"entries", v.entries}
    };
}

void to_json(json& j, const Pledge& p) {
    j = {
        {"id", p.id},
        {"company_id", p.company_id},
        {"customer_id", p.customer_id},
        {"scheme_id", p.scheme_id},
        {"pledge_no", p.pledge_no},
        {"principal", format_money(p.principal)},
        {"first_month_interest", format_money(p.first_month_interest)},
        {"document_charges", format_money(p.document_charges)},
        {"final_amount", format_money(p.final_amount)},
        {"interest_rate", format_rate_percent(p.monthly_rate)},
        {"status", to_string(p.status)},
        {"pledge_date", format_date(p.pledge_date)},
        {"due_date", format_date(p.due_date)},
        {"voucher_id", optional_id(p.voucher_id)}
    };
}

void to_json(json& j, const Payment& p) {
    j = {
        {"id", p.id},
        {"pledge_id", p.pledge_id},
        {"payment_kind", to_string(p.kind)},
        {"payment_date", format_date(p.payment_date)},
        {"created_on", format_date(p.created_on)},
        {"amount", format_money(p.amount)},
        {"interest", format_money(p.interest)},
        {"principal", format_money(p.principal)},
        {"penalty", format_money(p.penalty)},
        {"discount", format_money(p.discount)},
        {"balance_amount", format_money(p.balance_amount)},
        {"payment_method", p.method},
        {"receipt_no", p.receipt_no},
        {"remarks", p.remarks},
        {"voucher_id", optional_id(p.voucher_id)},
        {"created_by", p.created_by}
    };
}

void to_json(json& j, const TrialBalance& tb) {
    json lines = json::array();
    for (const auto& line : tb.lines) {
        lines.push_back({
            {"account_id", line.account_id},
            {"code", line.code},
            {"name", line.name},
            {"account_type", to_string(line.type)},
            {"is_active", line.active},
            {"debit", format_money(line.debit)},
            {"credit", format_money(line.credit)}
        });
    }
    j = {
        {"as_of", format_date(tb.as_of)},
        {"accounts", lines},
        {"total_debit", format_money(tb.total_debit)},
        {"total_credit", format_money(tb.total_credit)},
        {"is_balanced", tb.is_balanced}
    };
}

void to_json(json& j, const DayBook& book) {
    json entries = json::array();
    for (const auto& line : book.entries) {
        entries.push_back({
            {"voucher_id", line.entry.voucher_id},
            {"voucher_type", to_string(line.entry.voucher_type)},
            {"account_code", line.account_code},
            {"account_name", line.account_name},
            {"narration", line.entry.narration.empty() ? line.entry.voucher_narration : line.entry.narration},
            {"debit", format_money(line.entry.debit_amount())},
            {"credit", format_money(line.entry.credit_amount())},
            {"running_balance", format_money(line.running_balance)}
        });
    }
    j = {
        {"date", format_date(book.day)},
        {"opening_balance", format_money(book.opening_balance)},
        {"closing_balance", format_money(book.closing_balance)},
        {"total_debit", format_money(book.total_debit)},
        {"total_credit", format_money(book.total_credit)},
        {"cash_in", format_money(book.cash_in)},
        {"cash_out", format_money(book.cash_out)},
        {"entries", entries}
    };
}

void to_json(json& j, const ProfitAndLoss& pl) {
    j = {
        {"financial_year", pl.financial_year},
        {"from", format_date(pl.from)},
        {"to", format_date(pl.to)},
        {"revenue", statement_lines(pl.revenue)},
        {"expenses", statement_lines(pl.expenses)},
        {"total_revenue", format_money(pl.total_revenue)},
        {"total_expenses", format_money(pl.total_expenses)},
        {"net_profit", format_money(pl.net_profit)}
    };
}

void to_json(json& j, const BalanceSheet& bs) {
    j = {
        {"as_of", format_date(bs.as_of)},
        {"assets", statement_lines(bs.assets)},
        {"liabilities", statement_lines(bs.liabilities)},
        {"equity", statement_lines(bs.equity)},
        {"current_earnings", format_money(bs.current_earnings)},
        {"total_assets", format_money(bs.total_assets)},
        {"total_liabilities", format_money(bs.total_liabilities)},
        {"total_equity", format_money(bs.total_equity)},
        {"is_balanced", bs.is_balanced}
    };
}

void to_json(json& j, const AccountDaySummary& s) {
    j = {
        {"account_id", s.account_id},
        {"code", s.code},
        {"name", s.name},
        {"account_type", to_string(s.type)},
        {"debit", format_money(s.debit)},
        {"credit", format_money(s.credit)},
        {"net", format_money(s.net)},
        {"entry_count", s.entry_count}
    };
}

void to_json(json& j, const DaySummary& s) {
    j = {
        {"date", format_date(s.day)},
        {"debit", format_money(s.debit)},
        {"credit", format_money(s.credit)},
        {"voucher_count", s.voucher_count},
        {"voucher_types", s.voucher_types}
    };
}

void to_json(json& j, const CustomerStatement& st) {
    json lines = json::array();
    for (const auto& line : st.lines) {
        lines.push_back({
            {"date", format_date(line.day)},
            {"voucher_id", line.voucher_id},
            {"voucher_type", to_string(line.voucher_type)},
            {"narration", line.narration},
            {"debit", format_money(line.debit)},
            {"credit", format_money(line.credit)},
            {"running_balance", format_money(line.running_balance)}
        });
    }
    j = {
        {"account_id", st.account_id},
        {"account_code", st.account_code},
        {"account_name", st.account_name},
        {"from", format_date(st.from)},
        {"to", format_date(st.to)},
        {"opening_balance", format_money(st.opening_balance)},
        {"closing_balance", format_money(st.closing_balance)},
        {"total_debit", format_money(st.total_debit)},
        {"total_credit", format_money(st.total_credit)},
        {"lines", lines}
    };
}

void to_json(json& j, const SettlementQuote& q) {
    json breakdown = json::array();
    for (const auto& period : q.breakdown) {
        breakdown.push_back({
            {"month", period.index + 1},
            {"from", format_date(period.from)},
            {"to", format_date(period.to)},
            {"days", period.days},
            {"rate", format_rate_percent(period.rate)},
            {"amount", format_money(period.amount)},
            {"mandatory", period.mandatory}
        });
    }
    j = {
        {"pledge_id", q.pledge_id},
        {"as_of", format_date(q.as_of)},
        {"completed_months", q.completed_months},
        {"principal", format_money(q.principal)},
        {"total_interest", format_money(q.total_interest)},
        {"paid_interest", format_money(q.paid_interest)},
        {"paid_principal", format_money(q.paid_principal)},
        {"paid_discount", format_money(q.paid_discount)},
        {"remaining_interest", format_money(q.remaining_interest)},
        {"remaining_principal", format_money(q.remaining_principal)},
        {"final_amount", format_money(q.final_amount)},
        {"breakdown", breakdown}
    };
}

void to_json(json& j, const DisbursalResult& r) {
    j = {
        {"pledge", r.pledge},
        {"customer_account", r.customer_account},
        {"voucher", r.voucher},
        {"first_interest_payment", nullptr},
        {"first_interest_voucher", nullptr}
    };
    if (r.first_interest_payment) j["first_interest_payment"] = *r.first_interest_payment;
    if (r.first_interest_voucher) j["first_interest_voucher"] = *r.first_interest_voucher;
}

void to_json(json& j, const PaymentResult& r) {
    j = {
        {"payment", r.payment},
        {"voucher", r.voucher},
        {"reversal", nullptr},
        {"pledge_status", to_string(r.status)}
    };
    if (r.reversal) j["reversal"] = *r.reversal;
}

void to_json(json& j, const DeletionResult& r) {
    j = {
        {"payment_id", r.payment_id},
        {"reversal", r.reversal},
        {"pledge_status", to_string(r.status)}
    };
}

void to_json(json& j, const Modifiability& m) {
    j = {
        {"payment_id", m.payment_id},
        {"age_days", m.age_days},
        {"can_update", m.can_update},
        {"can_delete", m.can_delete},
        {"reason", m.reason}
    };
}

void to_json(json& j, const YearEndResult& r) {
    j = {
        {"financial_year", r.financial_year},
        {"start_date", format_date(r.start)},
        {"end_date", format_date(r.end)},
        {"voucher", nullptr},
        {"net_profit", format_money(r.net_profit)}
    };
    if (r.voucher) j["voucher"] = *r.voucher;
}

void to_json(json& j, const SealReport& r) {
    j = {
        {"company_id", r.company_id},
        {"vouchers_checked", r.vouchers_checked},
        {"broken", r.broken},
        {"audit_passed", r.broken.empty()}
    };
}

json error_body(const LedgerError& e) {
    if (e.kind() == ErrorKind::Consistency) {
        return {{"error", e.public_message()}};
    }
    return {{"error", e.public_message()}, {"code", e.code()}, {"kind", to_string(e.kind())}};
}

money_micro money_field(const json& body, const std::string& key, bool required) {
    if (!body.contains(key) || body.at(key).is_null()) {
        if (required) throw validation_error("InvalidAmount", "Field '" + key + "' is required.");
        return 0;
    }
    const json& value = body.at(key);
    if (value.is_string()) return parse_money(value.get<std::string>());
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(kMaxAmount / kMicrosPerUnit)) {
        throw validation_error("InvalidAmount", "Field '" + key + "' is out of range.");
    }
    if (value.is_number_integer()) return units(value.get<int64_t>());
    if (value.is_number_float()) return parse_money(value.dump());
    throw validation_error("InvalidAmount", "Field '" + key + "' is not an amount.");
}

VoucherDraft voucher_from_json(const json& body, int64_t company_id, const std::string& actor) {
    VoucherDraft draft = make_voucher(company_id, parse_voucher_type(string_field(body, "voucher_type", "journal")),
                                      date_field(body, "voucher_date"), string_field(body, "narration"), actor);
    draft.fiscal_year = string_field(body, "fiscal_year");

    if (!body.contains("entries") || !body.at("entries").is_array()) {
        throw validation_error("EmptyVoucher", "Voucher must have at least one entry.");
    }
    for (const auto& line : body.at("entries")) {
        EntryDraft entry;
        entry.account_id = id_field(line, "account_id");
        entry.direction = parse_direction(string_field(line, "dr_cr"));
        entry.amount = money_field(line, "amount");
        entry.narration = string_field(line, "narration");
        if (line.contains("reference") && line.at("reference").is_object()) {
            entry.reference = Reference{string_field(line.at("reference"), "kind"), id_field(line.at("reference"), "id")};
        }
        draft.entries.push_back(entry);
    }
    return draft;
}

DisbursalRequest disbursal_from_json(const json& body, int64_t company_id, const std::string& actor) {
    DisbursalRequest request;
    request.company_id = company_id;
    request.customer_id = id_field(body, "customer_id");
    request.scheme_id = id_field(body, "scheme_id");
    request.principal = money_field(body, "principal");
    if (body.contains("first_month_interest") && !body.at("first_month_interest").is_null()) {
        request.first_month_interest = money_field(body, "first_month_interest");
    }
    request.document_charges = money_field(body, "document_charges", false);
    request.pledge_date = date_field(body, "pledge_date");
    request.actor = actor;
    return request;
}

PaymentRequest payment_from_json(const json& body, int64_t company_id, const std::string& actor) {
    PaymentRequest request;
    request.company_id = company_id;
    if (body.contains("pledge_id")) request.pledge_id = id_field(body, "pledge_id");
    request.payment_date = date_field(body, "payment_date");
    request.amount = money_field(body, "amount");
    request.interest = money_field(body, "interest", false);
    request.principal = money_field(body, "principal", false);
    request.penalty = money_field(body, "penalty", false);
    request.discount = money_field(body, "discount", false);
    request.method = string_field(body, "payment_method", "cash");
    std::string receipt = string_field(body, "receipt_no");
    if (!receipt.empty()) request.receipt_no = receipt;
    request.remarks = string_field(body, "remarks");
    request.actor = actor;
    return request;
}

} // namespace ppl
