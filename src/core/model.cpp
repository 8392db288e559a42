/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: model.cpp
 * ============================================================================
 */

#include "model.hpp"
#include "errors.hpp"

namespace ppl {

std::string to_string(AccountType type) {
    switch (type) {
        case AccountType::Asset: return "Asset";
        case AccountType::Liability: return "Liability";
        case AccountType::Income: return "Income";
        case AccountType::Expense: return "Expense";
        case AccountType::Equity: return "Equity";
    }
    return "Asset";
}

std::string to_string(VoucherType type) {
    switch (type) {
        case VoucherType::LoanDisbursal: return "loan_disbursal";
        case VoucherType::Receipt: return "receipt";
        case VoucherType::Payment: return "payment";
        case VoucherType::Journal: return "journal";
        case VoucherType::Auction: return "auction";
        case VoucherType::YearEndClosing: return "year_end_closing";
        case VoucherType::YearOpening: return "year_opening";
    }
    return "journal";
}

std::string to_string(Direction direction) {
    return direction == Direction::Debit ? "D" : "C";
}

std::string to_string(PledgeStatus status) {
    switch (status) {
        case PledgeStatus::Active: return "active";
        case PledgeStatus::PartialPaid: return "partial_paid";
        case PledgeStatus::Redeemed: return "redeemed";
    }
    return "active";
}

std::string to_string(PaymentKind kind) {
    return kind == PaymentKind::FirstInterest ? "first_interest" : "regular";
}

AccountType parse_account_type(const std::string& text) {
    if (text == "Asset") return AccountType::Asset;
    if (text == "Liability") return AccountType::Liability;
    if (text == "Income") return AccountType::Income;
    if (text == "Expense") return AccountType::Expense;
    if (text == "Equity") return AccountType::Equity;
    throw validation_error("InvalidArgument", "Unknown account type '" + text + "'");
}

VoucherType parse_voucher_type(const std::string& text) {
    if (text == "loan_disbursal") return VoucherType::LoanDisbursal;
    if (text == "receipt") return VoucherType::Receipt;
    if (text == "payment") return VoucherType::Payment;
    if (text == "journal") return VoucherType::Journal;
    if (text == "auction") return VoucherType::Auction;
    if (text == "year_end_closing") return VoucherType::YearEndClosing;
    if (text == "year_opening") return VoucherType::YearOpening;
    throw validation_error("InvalidArgument", "Unknown voucher type '" + text + "'");
}

Direction parse_direction(const std::string& text) {
    if (text == "D" || text == "debit") return Direction::Debit;
    if (text == "C" || text == "credit") return Direction::Credit;
    throw validation_error("InvalidArgument", "Unknown entry direction '" + text + "'");
}

PledgeStatus parse_pledge_status(const std::string& text) {
    if (text == "active") return PledgeStatus::Active;
    if (text == "partial_paid") return PledgeStatus::PartialPaid;
    if (text == "redeemed") return PledgeStatus::Redeemed;
    throw validation_error("InvalidArgument", "Unknown pledge status '" + text + "'");
}

PaymentKind parse_payment_kind(const std::string& text) {
    if (text == "first_interest") return PaymentKind::FirstInterest;
    if (text == "regular") return PaymentKind::Regular;
    throw validation_error("InvalidArgument", "Unknown payment kind '" + text + "'");
}

bool is_debit_normal(AccountType type) {
    return type == AccountType::Asset || type == AccountType::Expense;
}

bool is_reserved(VoucherType type) {
    return type == VoucherType::YearEndClosing || type == VoucherType::YearOpening;
}

EntryDraft debit(int64_t account_id, money_micro amount, const std::string& narration,
                 std::optional<Reference> reference) {
    EntryDraft e;
    e.account_id = account_id;
    e.direction = Direction::Debit;
    e.amount = amount;
    e.narration = narration;
    e.reference = reference;
    return e;
}

EntryDraft credit(int64_t account_id, money_micro amount, const std::string& narration,
                  std::optional<Reference> reference) {
    EntryDraft e = debit(account_id, amount, narration, reference);
    e.direction = Direction::Credit;
    return e;
}

VoucherDraft make_voucher(int64_t company_id, VoucherType type, const date& voucher_date,
                          const std::string& narration, const std::string& actor) {
    VoucherDraft v;
    v.company_id = company_id;
    v.type = type;
    v.voucher_date = voucher_date;
    v.narration = narration;
    v.actor = actor;
    return v;
}

money_micro Voucher::total_debit() const {
    money_micro total = 0;
    for (const auto& e : entries) total = checked_add(total, e.debit_amount());
    return total;
}

money_micro Voucher::total_credit() const {
    money_micro total = 0;
    for (const auto& e : entries) total = checked_add(total, e.credit_amount());
    return total;
}

} // namespace ppl
