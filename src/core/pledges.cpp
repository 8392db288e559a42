/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pledges.cpp
 * ============================================================================
 */

#include "pledges.hpp"
#include "accounts.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "posting.hpp"
#include "reversal.hpp"

#include <algorithm>

namespace ppl {

namespace {

void require_cents(money_micro amount, const char* what) {
    if (!is_whole_cents(amount)) {
        throw validation_error("InvalidAmount", std::string(what) + " must be in whole cents.");
    }
    if (amount > kMaxAmount) {
        throw validation_error("InvalidAmount", std::string(what) + " " + format_money(amount) + " out of range.");
    }
}

void require_non_negative(money_micro amount, const char* what) {
    if (amount < 0) {
        throw validation_error("NonPositiveAmount", std::string(what) + " cannot be negative.");
    }
    require_cents(amount, what);
}

std::string zero_padded(long value, std::size_t width) {
    std::string text = std::to_string(value);
    if (text.size() < width) text.insert(0, width - text.size(), '0');
    return text;
}

long max_sequence(pqxx::transaction_base& tx, const char* table, const char* column, int64_t company_id,
                  const std::string& prefix) {
    pqxx::row r = tx.exec_params1(
        std::string("SELECT COALESCE(MAX(CAST(substring(") + column + " FROM $2::int + 1) AS BIGINT)), 0) FROM " + table +
        " WHERE company_id = $1 AND left(" + column + ", $2::int) = $3 AND substring(" + column + " FROM $2::int + 1) ~ '^[0-9]+$'",
        company_id, static_cast<int>(prefix.size()), prefix);
    return r[0].as<long>();
}

} // namespace

void validate_payment_breakdown(const PaymentRequest& request) {
    if (request.amount <= 0) {
        throw validation_error("NonPositiveAmount", "Payment amount must be positive.");
    }
    require_cents(request.amount, "Payment amount");
    require_non_negative(request.interest, "Interest");
    require_non_negative(request.principal, "Principal");
    require_non_negative(request.penalty, "Penalty");
    require_non_negative(request.discount, "Discount");

    money_micro parts = checked_add(checked_add(request.interest, request.principal), request.penalty);
    if (!within_tolerance(request.amount, parts)) {
        throw validation_error("InvalidPaymentBreakdown",
                               "Amount " + format_money(request.amount) + " does not equal interest + principal + penalty (" +
                               format_money(parts) + ").");
    }
}

void require_not_future(const date& payment_date, const date& today) {
    if (payment_date > today) {
        throw validation_error("InvalidArgument",
                               "Payment date " + format_date(payment_date) + " is after today (" + format_date(today) + ").");
    }
}

bool is_bank_method(const std::string& method) {
    return method == "bank" || method == "bank_transfer" || method == "cheque" || method == "upi";
}

std::string sequence_number(const std::string& prefix, const std::string& company_code, int year, long sequence) {
    return prefix + "-" + company_code + "-" + std::to_string(year) + "-" + zero_padded(sequence, 5);
}

std::string pledge_number(const std::string& prefix, long sequence) {
    return (prefix.empty() ? std::string("PL") : prefix) + "-" + zero_padded(sequence, 4);
}

VoucherDraft build_disbursal_voucher(const Pledge& pledge, const PostingAccounts& accounts,
                                     const std::string& customer_name, const std::string& actor) {
    Reference ref{"pledge", pledge.id};
    VoucherDraft draft = make_voucher(pledge.company_id, VoucherType::LoanDisbursal, pledge.pledge_date,
                                      "Loan disbursed against pledge " + pledge.pledge_no + " to " + customer_name, actor);

    draft.entries.push_back(debit(accounts.customer, pledge.principal, "Loan principal " + pledge.pledge_no, ref));
    draft.entries.push_back(credit(accounts.cash, pledge.principal - pledge.document_charges,
                                   "Cash paid out " + pledge.pledge_no, ref));
    if (pledge.document_charges > 0) {
        draft.entries.push_back(credit(accounts.document_income, pledge.document_charges,
                                       "Document charges " + pledge.pledge_no, ref));
    }
    return draft;
}

VoucherDraft build_first_interest_voucher(const Pledge& pledge, const Payment& payment,
                                          const PostingAccounts& accounts, const std::string& actor) {
    Reference ref{"payment", payment.id};
    VoucherDraft draft = make_voucher(pledge.company_id, VoucherType::Receipt, payment.payment_date,
                                      "First month interest " + pledge.pledge_no + " receipt " + payment.receipt_no, actor);
    draft.entries.push_back(debit(accounts.cash, payment.interest, "First month interest received", ref));
    draft.entries.push_back(credit(accounts.interest_income, payment.interest, "First month interest " + pledge.pledge_no, ref));
    return draft;
}

VoucherDraft build_payment_voucher(const Pledge& pledge, const Payment& payment,
                                   const PostingAccounts& accounts, const std::string& actor) {
    Reference ref{"payment", payment.id};
    VoucherDraft draft = make_voucher(pledge.company_id, VoucherType::Receipt, payment.payment_date,
                                      "Payment against pledge " + pledge.pledge_no + " receipt " + payment.receipt_no, actor);

    int64_t received_into = is_bank_method(payment.method) ? accounts.bank : accounts.cash;
    draft.entries.push_back(debit(received_into, payment.amount, "Received " + payment.method, ref));
    if (payment.discount > 0) {
        draft.entries.push_back(debit(accounts.discount_expense, payment.discount, "Discount allowed " + pledge.pledge_no, ref));
    }
    if (payment.principal + payment.discount > 0) {
        draft.entries.push_back(credit(accounts.customer, payment.principal + payment.discount,
                                       "Principal repaid " + pledge.pledge_no, ref));
    }
    if (payment.interest > 0) {
        draft.entries.push_back(credit(accounts.interest_income, payment.interest, "Interest " + pledge.pledge_no, ref));
    }
    if (payment.penalty > 0) {
        draft.entries.push_back(credit(accounts.penalty_income, payment.penalty, "Penalty " + pledge.pledge_no, ref));
    }
    return draft;
}

Modifiability payment_modifiability(const Payment& payment, const date& today,
                                    int update_window_days, int delete_window_days) {
    Modifiability m;
    m.payment_id = payment.id;
    m.age_days = std::max(0, static_cast<int>((today - payment.created_on).days()));

    if (payment.kind == PaymentKind::FirstInterest) {
        m.reason = "The mandatory first month interest cannot be modified.";
        return m;
    }

    m.can_update = m.age_days <= update_window_days;
    m.can_delete = m.age_days <= delete_window_days;
    if (!m.can_update) {
        m.reason = "Payments older than " + std::to_string(update_window_days) + " days are locked.";
    } else if (!m.can_delete) {
        m.reason = "Payments older than " + std::to_string(delete_window_days) + " days can be updated but not deleted.";
    }
    return m;
}

PostingAccounts PledgeBook::resolve_accounts(pqxx::transaction_base& tx, int64_t company_id, int64_t customer_id) {
    const AccountCodes& codes = config_.accounts;
    PostingAccounts accounts;
    accounts.cash = db::require_account_by_code(tx, company_id, codes.cash).id;
    accounts.bank = db::require_account_by_code(tx, company_id, codes.bank).id;
    accounts.interest_income = db::require_account_by_code(tx, company_id, codes.interest_income).id;
    accounts.document_income = db::require_account_by_code(tx, company_id, codes.document_income).id;
    accounts.penalty_income = db::require_account_by_code(tx, company_id, codes.penalty_income).id;
    accounts.discount_expense = db::require_account_by_code(tx, company_id, codes.discount_expense).id;

    AccountRegistry registry(codes);
    accounts.customer = registry.get_or_create_customer_subaccount(tx, customer_id, company_id).id;
    return accounts;
}

std::string PledgeBook::next_receipt_number(pqxx::transaction_base& tx, const Company& company,
                                            const std::string& prefix, const date& on_date) {
    int year = static_cast<int>(on_date.year());
    std::string head = prefix + "-" + company.code + "-" + std::to_string(year) + "-";
    long sequence = db::next_sequence(tx, company.id, "receipt:" + head,
                                      max_sequence(tx, "payments", "receipt_no", company.id, head));
    return sequence_number(prefix, company.code, year, sequence);
}

void PledgeBook::check_overpayment(const Pledge& pledge, const std::vector<Payment>& others,
                                   const PaymentRequest& request) {
    money_micro outstanding = total_due(pledge, request.payment_date) - total_paid(pledge, others);
    money_micro settling = request.principal + request.interest + request.discount;
    if (settling - outstanding > kTolerance) {
        throw validation_error("Overpayment",
                               "Payment settles " + format_money(settling) + " but only " + format_money(outstanding) +
                               " is due on pledge " + pledge.pledge_no + ".");
    }
}

Payment PledgeBook::insert_payment(pqxx::transaction_base& tx, const Pledge& pledge, PaymentKind kind,
                                   const PaymentRequest& request, const std::string& receipt_no, bool caller_numbered) {
    if (caller_numbered) {
        pqxx::result taken = tx.exec_params("SELECT 1 FROM payments WHERE receipt_no = $1", receipt_no);
        if (!taken.empty()) {
            throw state_conflict("DuplicateReceipt", "Receipt number " + receipt_no + " is already used.");
        }
    }

    pqxx::result inserted;
    try {
        inserted = tx.exec_params(
            "INSERT INTO payments (company_id, pledge_id, payment_kind, payment_date, amount_micros, interest_micros, "
            "principal_micros, penalty_micros, discount_micros, method, receipt_no, remarks, created_by) "
            "VALUES ($1, $2, $3, $4::date, $5, $6, $7, $8, $9, $10, $11, $12, $13) "
            "RETURNING id, to_char(created_at::date, 'YYYY-MM-DD')",
            pledge.company_id, pledge.id, to_string(kind), format_date(request.payment_date), request.amount,
            request.interest, request.principal, request.penalty, request.discount, request.method, receipt_no,
            request.remarks, request.actor);
    } catch (const pqxx::unique_violation&) {
        // Generated numbers come from number_sequences; a clash there is not the caller's doing.
        if (!caller_numbered) throw;
        throw state_conflict("DuplicateReceipt", "Receipt number " + receipt_no + " is already used.");
    }

    Payment p;
    p.id = inserted[0][0].as<int64_t>();
    p.created_on = parse_date(inserted[0][1].as<std::string>());
    p.company_id = pledge.company_id;
    p.pledge_id = pledge.id;
    p.kind = kind;
    p.payment_date = request.payment_date;
    p.amount = request.amount;
    p.interest = request.interest;
    p.principal = request.principal;
    p.penalty = request.penalty;
    p.discount = request.discount;
    p.method = request.method;
    p.receipt_no = receipt_no;
    p.remarks = request.remarks;
    p.created_by = request.actor;
    return p;
}

Voucher PledgeBook::post_payment_voucher(pqxx::transaction_base& tx, const Pledge& pledge, Payment& payment,
                                         const PostingAccounts& accounts, const std::string& actor) {
    VoucherDraft draft = payment.kind == PaymentKind::FirstInterest
        ? build_first_interest_voucher(pledge, payment, accounts, actor)
        : build_payment_voucher(pledge, payment, accounts, actor);

    Voucher voucher = PostingEngine::post(tx, draft);
    tx.exec_params0("UPDATE payments SET voucher_id = $1 WHERE id = $2", voucher.id, payment.id);
    payment.voucher_id = voucher.id;
    return voucher;
}

PledgeStatus PledgeBook::refresh_pledge(pqxx::transaction_base& tx, const Pledge& pledge) {
    std::vector<Payment> payments = db::load_payments(tx, pledge.company_id, pledge.id);
    recompute_payment_balances(pledge, payments);
    for (const auto& p : payments) {
        tx.exec_params0("UPDATE payments SET balance_amount_micros = $1 WHERE id = $2", p.balance_amount, p.id);
    }

    PledgeStatus status = derive_status(pledge, payments, status_date(pledge, payments));
    if (status != pledge.status) {
        tx.exec_params0("UPDATE pledges SET status = $1 WHERE id = $2", to_string(status), pledge.id);
        ppl_log("INFO", "Pledge " + pledge.pledge_no + " status " + to_string(pledge.status) + " -> " + to_string(status) + ".");
    }
    return status;
}

DisbursalResult PledgeBook::disburse(pqxx::transaction_base& tx, const DisbursalRequest& request) {
    if (request.principal <= 0) {
        throw validation_error("NonPositiveAmount", "Principal must be positive.");
    }
    require_cents(request.principal, "Principal");
    require_non_negative(request.document_charges, "Document charges");
    if (request.document_charges >= request.principal) {
        throw validation_error("InvalidArgument", "Document charges must be less than the principal.");
    }
    if (request.first_month_interest) require_non_negative(*request.first_month_interest, "First month interest");

    Company company = db::load_company(tx, request.company_id, db::RowLock::Share);
    Customer customer = db::load_customer(tx, company.id, request.customer_id);
    Scheme scheme = db::load_scheme(tx, company.id, request.scheme_id);

    PostingAccounts accounts = resolve_accounts(tx, company.id, customer.id);

    money_micro first_month = request.first_month_interest
        ? *request.first_month_interest
        : apply_rate(request.principal, scheme.monthly_rate);

    std::string prefix = scheme.prefix.empty() ? "PL" : scheme.prefix;
    long sequence = db::next_sequence(tx, company.id, "pledge:" + prefix + "-",
                                      max_sequence(tx, "pledges", "pledge_no", company.id, prefix + "-"));
    std::string pledge_no = pledge_number(prefix, sequence);
    date due_date = add_months(request.pledge_date, scheme.duration_months);

    pqxx::row row = tx.exec_params1(
        "INSERT INTO pledges (company_id, customer_id, scheme_id, pledge_no, principal_micros, first_month_interest_micros, "
        "document_charges_micros, final_amount_micros, monthly_rate_ppm, status, pledge_date, due_date, created_by) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $5::bigint + $6::bigint + $7::bigint, $8, 'active', $9::date, $10::date, $11) "
        "RETURNING id, final_amount_micros",
        company.id, customer.id, scheme.id, pledge_no, request.principal, first_month, request.document_charges,
        scheme.monthly_rate, format_date(request.pledge_date), format_date(due_date), request.actor);

    DisbursalResult result;
    Pledge& pledge = result.pledge;
    pledge.id = row[0].as<int64_t>();
    pledge.final_amount = row[1].as<int64_t>();
    pledge.company_id = company.id;
    pledge.customer_id = customer.id;
    pledge.scheme_id = scheme.id;
    pledge.pledge_no = pledge_no;
    pledge.principal = request.principal;
    pledge.first_month_interest = first_month;
    pledge.document_charges = request.document_charges;
    pledge.monthly_rate = scheme.monthly_rate;
    pledge.status = PledgeStatus::Active;
    pledge.pledge_date = request.pledge_date;
    pledge.due_date = due_date;

    result.customer_account = db::load_account(tx, company.id, accounts.customer);
    result.voucher = PostingEngine::post(tx, build_disbursal_voucher(pledge, accounts, customer.name, request.actor));
    tx.exec_params0("UPDATE pledges SET voucher_id = $1 WHERE id = $2", result.voucher.id, pledge.id);
    pledge.voucher_id = result.voucher.id;

    if (first_month > 0) {
        PaymentRequest fi;
        fi.company_id = company.id;
        fi.pledge_id = pledge.id;
        fi.payment_date = request.pledge_date;
        fi.amount = first_month;
        fi.interest = first_month;
        fi.method = "auto";
        fi.remarks = "Mandatory first month interest";
        fi.actor = request.actor;

        Payment payment = insert_payment(tx, pledge, PaymentKind::FirstInterest, fi,
                                         next_receipt_number(tx, company, "FI", request.pledge_date), false);
        result.first_interest_voucher = post_payment_voucher(tx, pledge, payment, accounts, request.actor);
        result.first_interest_payment = payment;
    }

    pledge.status = refresh_pledge(tx, pledge);
    if (result.first_interest_payment) {
        result.first_interest_payment->balance_amount = db::load_payment(tx, company.id, result.first_interest_payment->id).balance_amount;
    }

    ppl_log("INFO", "Pledge " + pledge_no + " disbursed: principal " + format_money(pledge.principal) +
                    ", first month interest " + format_money(first_month) + ", document charges " +
                    format_money(pledge.document_charges) + ".");
    return result;
}

PaymentResult PledgeBook::record_payment(pqxx::transaction_base& tx, const PaymentRequest& request, const date& today) {
    validate_payment_breakdown(request);
    require_not_future(request.payment_date, today);

    Company company = db::load_company(tx, request.company_id, db::RowLock::Share);
    Pledge pledge = db::load_pledge(tx, company.id, request.pledge_id, db::RowLock::Update);

    if (pledge.status == PledgeStatus::Redeemed) {
        throw state_conflict("PledgeRedeemed", "Pledge " + pledge.pledge_no + " is already redeemed.");
    }
    if (request.payment_date < pledge.pledge_date) {
        throw validation_error("InvalidArgument", "Payment date is before the pledge date.");
    }

    check_overpayment(pledge, db::load_payments(tx, company.id, pledge.id), request);

    bool caller_numbered = request.receipt_no && !request.receipt_no->empty();
    std::string receipt_no = caller_numbered ? *request.receipt_no
                                             : next_receipt_number(tx, company, "RCPT", request.payment_date);

    PostingAccounts accounts = resolve_accounts(tx, company.id, pledge.customer_id);

    PaymentResult result;
    result.payment = insert_payment(tx, pledge, PaymentKind::Regular, request, receipt_no, caller_numbered);
    result.voucher = post_payment_voucher(tx, pledge, result.payment, accounts, request.actor);
    result.status = refresh_pledge(tx, pledge);
    result.payment.balance_amount = db::load_payment(tx, company.id, result.payment.id).balance_amount;

    ppl_log("INFO", "Payment " + receipt_no + " of " + format_money(request.amount) + " recorded on pledge " +
                    pledge.pledge_no + " by " + request.actor + ".");
    return result;
}

PaymentResult PledgeBook::update_payment(pqxx::transaction_base& tx, int64_t payment_id,
                                         const PaymentRequest& revised, const date& today) {
    validate_payment_breakdown(revised);
    require_not_future(revised.payment_date, today);

    Company company = db::load_company(tx, revised.company_id, db::RowLock::Share);
    Payment existing = db::load_payment(tx, company.id, payment_id);
    Pledge pledge = db::load_pledge(tx, company.id, existing.pledge_id, db::RowLock::Update);

    Modifiability m = payment_modifiability(existing, today, config_.payment_update_window_days,
                                            config_.payment_delete_window_days);
    if (existing.kind == PaymentKind::FirstInterest) {
        throw state_conflict("MandatoryPaymentLocked", m.reason);
    }
    if (!m.can_update) {
        throw state_conflict("PaymentTooOld", m.reason);
    }
    if (revised.payment_date < pledge.pledge_date) {
        throw validation_error("InvalidArgument", "Payment date is before the pledge date.");
    }
    if (!existing.voucher_id) {
        throw consistency_error("Payment " + existing.receipt_no + " has no voucher.");
    }

    std::vector<Payment> others;
    for (const auto& p : db::load_payments(tx, company.id, pledge.id)) {
        if (p.id != existing.id) others.push_back(p);
    }
    check_overpayment(pledge, others, revised);

    PaymentResult result;
    result.reversal = ReversalEngine::reverse(tx, company.id, *existing.voucher_id, revised.actor,
                                              "payment " + existing.receipt_no + " updated", today);

    tx.exec_params0(
        "UPDATE payments SET payment_date = $1::date, amount_micros = $2, interest_micros = $3, principal_micros = $4, "
        "penalty_micros = $5, discount_micros = $6, method = $7, remarks = $8, voucher_id = NULL WHERE id = $9",
        format_date(revised.payment_date), revised.amount, revised.interest, revised.principal, revised.penalty,
        revised.discount, revised.method, revised.remarks, existing.id);

    Payment updated = existing;
    updated.payment_date = revised.payment_date;
    updated.amount = revised.amount;
    updated.interest = revised.interest;
    updated.principal = revised.principal;
    updated.penalty = revised.penalty;
    updated.discount = revised.discount;
    updated.method = revised.method;
    updated.remarks = revised.remarks;

    PostingAccounts accounts = resolve_accounts(tx, company.id, pledge.customer_id);
    result.voucher = post_payment_voucher(tx, pledge, updated, accounts, revised.actor);
    result.status = refresh_pledge(tx, pledge);
    updated.balance_amount = db::load_payment(tx, company.id, updated.id).balance_amount;
    result.payment = updated;

    ppl_log("INFO", "Payment " + existing.receipt_no + " updated by " + revised.actor + ": voucher #" +
                    std::to_string(*existing.voucher_id) + " reversed, voucher #" + std::to_string(result.voucher.id) + " posted.");
    return result;
}

DeletionResult PledgeBook::delete_payment(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id,
                                          const std::string& actor, const date& today) {
    Company company = db::load_company(tx, company_id, db::RowLock::Share);
    Payment existing = db::load_payment(tx, company.id, payment_id);
    Pledge pledge = db::load_pledge(tx, company.id, existing.pledge_id, db::RowLock::Update);

    Modifiability m = payment_modifiability(existing, today, config_.payment_update_window_days,
                                            config_.payment_delete_window_days);
    if (existing.kind == PaymentKind::FirstInterest) {
        throw state_conflict("MandatoryPaymentLocked", m.reason);
    }
    if (!m.can_delete) {
        throw state_conflict("PaymentTooOld", m.reason);
    }
    if (!existing.voucher_id) {
        throw consistency_error("Payment " + existing.receipt_no + " has no voucher.");
    }

    DeletionResult result;
    result.payment_id = existing.id;
    result.reversal = ReversalEngine::reverse(tx, company.id, *existing.voucher_id, actor,
                                              "payment " + existing.receipt_no + " deleted", today);

    tx.exec_params0("DELETE FROM payments WHERE id = $1", existing.id);
    result.status = refresh_pledge(tx, pledge);

    ppl_log("INFO", "Payment " + existing.receipt_no + " deleted by " + actor + "; voucher #" +
                    std::to_string(*existing.voucher_id) + " reversed.");
    return result;
}

Modifiability PledgeBook::check_modifiable(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id,
                                           const date& today) {
    Payment payment = db::load_payment(tx, company_id, payment_id);
    return payment_modifiability(payment, today, config_.payment_update_window_days, config_.payment_delete_window_days);
}

SettlementQuote PledgeBook::quote(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id, const date& as_of) {
    Pledge pledge = db::load_pledge(tx, company_id, pledge_id);
    if (as_of < pledge.pledge_date) {
        throw validation_error("InvalidArgument", "Settlement date is before the pledge date.");
    }
    return settlement_quote(pledge, db::load_payments(tx, company_id, pledge_id), as_of);
}

} // namespace ppl
