/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: model.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Records the ledger reads and writes. Every company-owned record carries
 * its company_id; no query in the engine crosses that key.
 * ============================================================================
 */

#ifndef PPL_MODEL_HPP
#define PPL_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dates.hpp"
#include "money.hpp"

namespace ppl {

    enum class AccountType { Asset, Liability, Income, Expense, Equity };

    enum class VoucherType {
        LoanDisbursal,
        Receipt,
        Payment,
        Journal,
        Auction,
        YearEndClosing,
        YearOpening
    };

    enum class Direction { Debit, Credit };

    enum class PledgeStatus { Active, PartialPaid, Redeemed };

    enum class PaymentKind { FirstInterest, Regular };

    std::string to_string(AccountType type);
    std::string to_string(VoucherType type);
    std::string to_string(Direction direction);
    std::string to_string(PledgeStatus status);
    std::string to_string(PaymentKind kind);

    // Throw LedgerError(InvalidArgument) on an unknown name.
    AccountType parse_account_type(const std::string& text);
    VoucherType parse_voucher_type(const std::string& text);
    Direction parse_direction(const std::string& text);
    PledgeStatus parse_pledge_status(const std::string& text);
    PaymentKind parse_payment_kind(const std::string& text);

    // Asset and Expense balances grow with debits.
    bool is_debit_normal(AccountType type);

    // Closing and opening vouchers are posted only by the closing engine.
    bool is_reserved(VoucherType type);

    struct Company {
        int64_t id = 0;
        std::string code;
        std::string name;
        int fiscal_start_month = 4;
        int fiscal_start_day = 1;
    };

    struct Account {
        int64_t id = 0;
        int64_t company_id = 0;
        std::string code;
        std::string name;
        AccountType type = AccountType::Asset;
        std::optional<int64_t> parent_id;
        bool active = true;
    };

    struct Customer {
        int64_t id = 0;
        int64_t company_id = 0;
        std::string name;
        std::optional<int64_t> coa_account_id;
    };

    struct Scheme {
        int64_t id = 0;
        int64_t company_id = 0;
        std::string name;
        std::string prefix;
        rate_ppm monthly_rate = 0;
        int duration_months = 12;
    };

    /**
     * @brief Back-link from a ledger line to the business object that caused it.
     */
    struct Reference {
        std::string kind;   // "pledge", "payment", "voucher"
        int64_t id = 0;
    };

    struct EntryDraft {
        int64_t account_id = 0;
        Direction direction = Direction::Debit;
        money_micro amount = 0;
        std::string narration;
        std::optional<Reference> reference;
    };

    EntryDraft debit(int64_t account_id, money_micro amount, const std::string& narration,
                     std::optional<Reference> reference = std::nullopt);
    EntryDraft credit(int64_t account_id, money_micro amount, const std::string& narration,
                      std::optional<Reference> reference = std::nullopt);

    struct VoucherDraft {
        int64_t company_id = 0;
        VoucherType type = VoucherType::Journal;
        date voucher_date;
        std::string narration;
        std::string actor;
        std::string fiscal_year;
        std::optional<int64_t> reverses_voucher_id;
        std::vector<EntryDraft> entries;
    };

    VoucherDraft make_voucher(int64_t company_id, VoucherType type, const date& voucher_date,
                              const std::string& narration, const std::string& actor);

    struct LedgerEntry {
        int64_t id = 0;
        int64_t voucher_id = 0;
        int64_t company_id = 0;
        int64_t account_id = 0;
        Direction direction = Direction::Debit;
        money_micro amount = 0;
        std::string narration;
        std::optional<Reference> reference;
        date transaction_date;

        money_micro debit_amount() const { return direction == Direction::Debit ? amount : 0; }
        money_micro credit_amount() const { return direction == Direction::Credit ? amount : 0; }
    };

    struct Voucher {
        int64_t id = 0;
        int64_t company_id = 0;
        VoucherType type = VoucherType::Journal;
        date voucher_date;
        std::string narration;
        std::string created_by;
        std::string created_at;
        std::string fiscal_year;
        std::optional<int64_t> reverses_voucher_id;
        std::string seal_hash;
        std::vector<LedgerEntry> entries;

        money_micro total_debit() const;
        money_micro total_credit() const;
    };

    struct Pledge {
        int64_t id = 0;
        int64_t company_id = 0;
        int64_t customer_id = 0;
        int64_t scheme_id = 0;
        std::string pledge_no;
        money_micro principal = 0;
        money_micro first_month_interest = 0;
        money_micro document_charges = 0;
        money_micro final_amount = 0;
        rate_ppm monthly_rate = 0;   // snapshot of the scheme at disbursal
        PledgeStatus status = PledgeStatus::Active;
        date pledge_date;
        date due_date;
        std::optional<int64_t> voucher_id;
    };

    struct Payment {
        int64_t id = 0;
        int64_t company_id = 0;
        int64_t pledge_id = 0;
        PaymentKind kind = PaymentKind::Regular;
        date payment_date;
        date created_on;
        money_micro amount = 0;
        money_micro interest = 0;
        money_micro principal = 0;
        money_micro penalty = 0;
        money_micro discount = 0;
        money_micro balance_amount = 0;   // cache, rewritten on every payment write
        std::string method;
        std::string receipt_no;
        std::string remarks;
        std::optional<int64_t> voucher_id;
        std::string created_by;

        /**
         * @brief How much of the pledge's due this payment clears:
         * principal + interest + discount. Penalty is income, not due.
         */
        money_micro settled_value() const { return principal + interest + discount; }
    };

} // namespace ppl

#endif // PPL_MODEL_HPP
