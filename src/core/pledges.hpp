/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pledges.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Pledge disbursal and payment posting. Each operation reads, computes and
 * writes inside the caller's transaction with the pledge row locked, so two
 * payments against one pledge cannot both see the same balance. Derived
 * fields (final_amount, balance_amount, status) are written by the same
 * transaction that changes their inputs.
 * ============================================================================
 */

#ifndef PPL_PLEDGES_HPP
#define PPL_PLEDGES_HPP

#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>

#include "config.hpp"
#include "model.hpp"
#include "settlement.hpp"

namespace ppl {

    struct DisbursalRequest {
        int64_t company_id = 0;
        int64_t customer_id = 0;
        int64_t scheme_id = 0;
        money_micro principal = 0;
        std::optional<money_micro> first_month_interest;    // scheme rate when absent
        money_micro document_charges = 0;
        date pledge_date;
        std::string actor;
    };

    struct DisbursalResult {
        Pledge pledge;
        Account customer_account;
        Voucher voucher;
        std::optional<Payment> first_interest_payment;
        std::optional<Voucher> first_interest_voucher;
    };

    struct PaymentRequest {
        int64_t company_id = 0;
        int64_t pledge_id = 0;
        date payment_date;
        money_micro amount = 0;
        money_micro interest = 0;
        money_micro principal = 0;
        money_micro penalty = 0;
        money_micro discount = 0;
        std::string method = "cash";
        std::optional<std::string> receipt_no;
        std::string remarks;
        std::string actor;
    };

    struct PaymentResult {
        Payment payment;
        Voucher voucher;
        std::optional<Voucher> reversal;    // set by update_payment
        PledgeStatus status = PledgeStatus::Active;
    };

    struct DeletionResult {
        int64_t payment_id = 0;
        Voucher reversal;
        PledgeStatus status = PledgeStatus::Active;
    };

    struct Modifiability {
        int64_t payment_id = 0;
        int age_days = 0;
        bool can_update = false;
        bool can_delete = false;
        std::string reason;
    };

    /**
     * @brief Resolved ids of the accounts a pledge posts to.
     */
    struct PostingAccounts {
        int64_t cash = 0;
        int64_t bank = 0;
        int64_t customer = 0;
        int64_t interest_income = 0;
        int64_t document_income = 0;
        int64_t penalty_income = 0;
        int64_t discount_expense = 0;
    };

    /**
     * validate_payment_breakdown
     * amount > 0, every component >= 0 and in whole cents, and
     * amount == interest + principal + penalty within kTolerance.
     */
    void validate_payment_breakdown(const PaymentRequest& request);

    // Payments are entered on or after the day they happen, never ahead.
    void require_not_future(const date& payment_date, const date& today);

    bool is_bank_method(const std::string& method);

    // "RCPT-HO-2024-00042"
    std::string sequence_number(const std::string& prefix, const std::string& company_code, int year, long sequence);

    // "GL-0007"
    std::string pledge_number(const std::string& prefix, long sequence);

    /**
     * @brief Dr customer principal; Cr cash principal less document charges;
     * Cr document income document charges.
     */
    VoucherDraft build_disbursal_voucher(const Pledge& pledge, const PostingAccounts& accounts,
                                         const std::string& customer_name, const std::string& actor);

    // Dr cash, Cr interest income.
    VoucherDraft build_first_interest_voucher(const Pledge& pledge, const Payment& payment,
                                              const PostingAccounts& accounts, const std::string& actor);

    /**
     * build_payment_voucher
     * Dr cash (or bank) amount, Dr discount allowed discount; Cr customer
     * principal + discount, Cr interest income interest, Cr penalty income
     * penalty. Zero lines are left out.
     */
    VoucherDraft build_payment_voucher(const Pledge& pledge, const Payment& payment,
                                       const PostingAccounts& accounts, const std::string& actor);

    /**
     * @brief Age is counted from the day the payment was entered. The
     * automatic first-interest payment can never be changed.
     */
    Modifiability payment_modifiability(const Payment& payment, const date& today,
                                        int update_window_days, int delete_window_days);

    class PledgeBook {
    public:
        explicit PledgeBook(const LedgerConfig& config) : config_(config) {}

        DisbursalResult disburse(pqxx::transaction_base& tx, const DisbursalRequest& request);

        /**
         * record_payment
         * Throws PledgeRedeemed, Overpayment (settles more than is due on the
         * payment date), DuplicateReceipt for a caller-supplied receipt number
         * already in use, or InvalidArgument for a date after today.
         */
        PaymentResult record_payment(pqxx::transaction_base& tx, const PaymentRequest& request, const date& today);

        /**
         * update_payment
         * Reverses the payment's voucher, posts the revised one and keeps the
         * receipt number. Throws MandatoryPaymentLocked or PaymentTooOld.
         */
        PaymentResult update_payment(pqxx::transaction_base& tx, int64_t payment_id,
                                     const PaymentRequest& revised, const date& today);

        DeletionResult delete_payment(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id,
                                      const std::string& actor, const date& today);

        Modifiability check_modifiable(pqxx::transaction_base& tx, int64_t company_id, int64_t payment_id,
                                       const date& today);

        SettlementQuote quote(pqxx::transaction_base& tx, int64_t company_id, int64_t pledge_id, const date& as_of);

    private:
        PostingAccounts resolve_accounts(pqxx::transaction_base& tx, int64_t company_id, int64_t customer_id);

        std::string next_receipt_number(pqxx::transaction_base& tx, const Company& company,
                                        const std::string& prefix, const date& on_date);

        void check_overpayment(const Pledge& pledge, const std::vector<Payment>& others,
                               const PaymentRequest& request);

        Payment insert_payment(pqxx::transaction_base& tx, const Pledge& pledge, PaymentKind kind,
                               const PaymentRequest& request, const std::string& receipt_no, bool caller_numbered);

        Voucher post_payment_voucher(pqxx::transaction_base& tx, const Pledge& pledge, Payment& payment,
                                     const PostingAccounts& accounts, const std::string& actor);

        PledgeStatus refresh_pledge(pqxx::transaction_base& tx, const Pledge& pledge);

        LedgerConfig config_;
    };

} // namespace ppl

#endif // PPL_PLEDGES_HPP
