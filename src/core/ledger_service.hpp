/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_service.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The public face of the engine. Each call opens its own connection, runs
 * one transaction and commits it, or rolls it back and rethrows. The
 * service holds nothing but its configuration, so one instance can be
 * shared by every request thread.
 * ============================================================================
 */

#ifndef PPL_LEDGER_SERVICE_HPP
#define PPL_LEDGER_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "accounts.hpp"
#include "balances.hpp"
#include "closing.hpp"
#include "config.hpp"
#include "model.hpp"
#include "pledges.hpp"
#include "settlement.hpp"

namespace ppl {

    struct SealReport {
        int64_t company_id = 0;
        int vouchers_checked = 0;
        std::vector<int64_t> broken;    // voucher ids whose seal no longer matches
    };

    class LedgerService {
    public:
        explicit LedgerService(const LedgerConfig& config);

        const LedgerConfig& config() const { return config_; }

        void ensure_schema();

        // Master data the ledger consumes.
        Company create_company(const std::string& code, const std::string& name,
                               int fiscal_start_month = 4, int fiscal_start_day = 1);
        Customer create_customer(int64_t company_id, const std::string& name);
        Scheme create_scheme(int64_t company_id, const std::string& name, const std::string& prefix,
                             rate_ppm monthly_rate, int duration_months);

        // Account Registry
        int initialize_chart_of_accounts(int64_t company_id);
        Account create_account(int64_t company_id, const std::string& name, const std::string& code,
                               AccountType type, std::optional<int64_t> parent_id = std::nullopt);
        Account update_account(int64_t company_id, int64_t account_id, const std::string& name, AccountType type);
        DeactivateOutcome deactivate_account(int64_t company_id, int64_t account_id);
        Account customer_account(int64_t company_id, int64_t customer_id);
        std::vector<Account> list_accounts(int64_t company_id);

        // Posting and reversal
        Voucher post_voucher(const VoucherDraft& draft);
        Voucher reverse_voucher(int64_t company_id, int64_t voucher_id, const std::string& actor, const std::string& reason);
        Voucher get_voucher(int64_t company_id, int64_t voucher_id);

        // Balances and reports
        money_micro account_balance(int64_t company_id, int64_t account_id, const date& as_of);
        TrialBalance trial_balance(int64_t company_id, const date& as_of);
        DayBook daily_summary(int64_t company_id, const date& day);
        ProfitAndLoss profit_and_loss(int64_t company_id, const std::string& financial_year);
        BalanceSheet balance_sheet(int64_t company_id, const date& as_of);
        std::vector<AccountDaySummary> account_wise_summary(int64_t company_id, const date& day);
        std::vector<DaySummary> day_wise_summary(int64_t company_id, const date& from, const date& to);
        CustomerStatement customer_statement(int64_t company_id, int64_t customer_id, const date& from, const date& to);

        // Pledges and payments
        DisbursalResult disburse_pledge(const DisbursalRequest& request);
        PaymentResult record_payment(const PaymentRequest& request);
        PaymentResult update_payment(int64_t payment_id, const PaymentRequest& revised);
        DeletionResult delete_payment(int64_t company_id, int64_t payment_id, const std::string& actor);
        Modifiability payment_modifiability(int64_t company_id, int64_t payment_id);
        SettlementQuote settlement_quote(int64_t company_id, int64_t pledge_id, const date& as_of);
        Pledge get_pledge(int64_t company_id, int64_t pledge_id);
        std::vector<Payment> pledge_payments(int64_t company_id, int64_t pledge_id);

        // Period closing
        YearEndResult close_year(int64_t company_id, const std::string& financial_year,
                                 const std::string& actor, const std::string& confirmation);
        YearEndResult open_year(int64_t company_id, const std::string& financial_year,
                                const std::string& actor, const std::string& confirmation);

        SealReport verify_seals(int64_t company_id);

    private:
        LedgerConfig config_;
    };

} // namespace ppl

#endif // PPL_LEDGER_SERVICE_HPP
