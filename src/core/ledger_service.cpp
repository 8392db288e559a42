/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_service.cpp
 * ============================================================================
 */

#include "ledger_service.hpp"
#include "crypto.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "posting.hpp"
#include "reversal.hpp"

#include <pqxx/pqxx>
#include <utility>

namespace ppl {

namespace {

typedef pqxx::transaction<pqxx::isolation_level::serializable> serializable_work;

template <typename Txn, typename Fn>
auto run(const LedgerConfig& config, const std::string& operation, Fn fn) -> decltype(fn(std::declval<Txn&>())) {
    try {
        pqxx::connection C(config.db_conn);
        Txn W(C);
        auto result = fn(W);
        W.commit();
        return result;
    } catch (const LedgerError& e) {
        if (e.kind() == ErrorKind::Consistency) {
            ppl_log("ERROR", operation + " rolled back, internal invariant violated: " + std::string(e.what()));
        } else {
            ppl_log("WARN", operation + " rejected [" + e.code() + "]: " + e.what());
        }
        throw;
    } catch (const pqxx::sql_error& e) {
        ppl_log("ERROR", operation + " database error: " + std::string(e.what()) + " | query: " + e.query());
        throw;
    } catch (const pqxx::broken_connection& e) {
        ppl_log("ERROR", operation + " lost its database connection: " + std::string(e.what()));
        throw;
    }
}

template <typename Fn>
auto run(const LedgerConfig& config, const std::string& operation, Fn fn) -> decltype(fn(std::declval<pqxx::work&>())) {
    return run<pqxx::work>(config, operation, fn);
}

void require_name(const std::string& value, const char* what) {
    if (value.empty()) {
        throw validation_error("InvalidArgument", std::string(what) + " is required.");
    }
}

} // namespace

LedgerService::LedgerService(const LedgerConfig& config) : config_(config) {
    set_log_capacity(config_.log_capacity);
}

void LedgerService::ensure_schema() {
    run(config_, "ensure_schema", [](pqxx::work& W) {
        db::ensure_schema(W);
        return true;
    });
    ppl_log("INFO", "Database schema verified.");
}

Company LedgerService::create_company(const std::string& code, const std::string& name,
                                      int fiscal_start_month, int fiscal_start_day) {
    require_name(code, "Company code");
    require_name(name, "Company name");
    FinancialYear::starting(2000, fiscal_start_month, fiscal_start_day);

    return run(config_, "create_company", [&](pqxx::work& W) {
        pqxx::row row = W.exec_params1(
            "INSERT INTO companies (code, name, fiscal_start_month, fiscal_start_day) VALUES ($1, $2, $3, $4) RETURNING id",
            code, name, fiscal_start_month, fiscal_start_day);
        Company c;
        c.id = row[0].as<int64_t>();
        c.code = code;
        c.name = name;
        c.fiscal_start_month = fiscal_start_month;
        c.fiscal_start_day = fiscal_start_day;
        return c;
    });
}

Customer LedgerService::create_customer(int64_t company_id, const std::string& name) {
    require_name(name, "Customer name");
    return run(config_, "create_customer", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        pqxx::row row = W.exec_params1("INSERT INTO customers (company_id, name) VALUES ($1, $2) RETURNING id", company_id, name);
        Customer c;
        c.id = row[0].as<int64_t>();
        c.company_id = company_id;
        c.name = name;
        return c;
    });
}

Scheme LedgerService::create_scheme(int64_t company_id, const std::string& name, const std::string& prefix,
                                    rate_ppm monthly_rate, int duration_months) {
    require_name(name, "Scheme name");
    if (monthly_rate < 0 || duration_months <= 0) {
        throw validation_error("InvalidArgument", "Scheme rate must be >= 0 and duration > 0.");
    }
    return run(config_, "create_scheme", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        pqxx::row row = W.exec_params1(
            "INSERT INTO schemes (company_id, name, prefix, monthly_rate_ppm, duration_months) VALUES ($1, $2, $3, $4, $5) RETURNING id",
            company_id, name, prefix.empty() ? std::string("PL") : prefix, monthly_rate, duration_months);
        Scheme s;
        s.id = row[0].as<int64_t>();
        s.company_id = company_id;
        s.name = name;
        s.prefix = prefix.empty() ? "PL" : prefix;
        s.monthly_rate = monthly_rate;
        s.duration_months = duration_months;
        return s;
    });
}

int LedgerService::initialize_chart_of_accounts(int64_t company_id) {
    return run(config_, "initialize_chart_of_accounts", [&](pqxx::work& W) {
        return AccountRegistry(config_.accounts).initialize_chart(W, company_id);
    });
}

Account LedgerService::create_account(int64_t company_id, const std::string& name, const std::string& code,
                                      AccountType type, std::optional<int64_t> parent_id) {
    return run(config_, "create_account", [&](pqxx::work& W) {
        return AccountRegistry(config_.accounts).create_account(W, company_id, name, code, type, parent_id);
    });
}

Account LedgerService::update_account(int64_t company_id, int64_t account_id, const std::string& name, AccountType type) {
    return run(config_, "update_account", [&](pqxx::work& W) {
        return AccountRegistry(config_.accounts).update_account(W, company_id, account_id, name, type);
    });
}

DeactivateOutcome LedgerService::deactivate_account(int64_t company_id, int64_t account_id) {
    return run(config_, "deactivate_account", [&](pqxx::work& W) {
        return AccountRegistry(config_.accounts).deactivate(W, company_id, account_id);
    });
}

Account LedgerService::customer_account(int64_t company_id, int64_t customer_id) {
    return run(config_, "customer_account", [&](pqxx::work& W) {
        return AccountRegistry(config_.accounts).get_or_create_customer_subaccount(W, customer_id, company_id);
    });
}

std::vector<Account> LedgerService::list_accounts(int64_t company_id) {
    return run(config_, "list_accounts", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        return db::load_accounts(W, company_id);
    });
}

Voucher LedgerService::post_voucher(const VoucherDraft& draft) {
    return run(config_, "post_voucher", [&](pqxx::work& W) {
        db::load_company(W, draft.company_id, db::RowLock::Share);
        return PostingEngine::post_journal(W, draft);
    });
}

Voucher LedgerService::reverse_voucher(int64_t company_id, int64_t voucher_id, const std::string& actor, const std::string& reason) {
    return run(config_, "reverse_voucher", [&](pqxx::work& W) {
        db::load_company(W, company_id, db::RowLock::Share);
        return ReversalEngine::reverse(W, company_id, voucher_id, actor, reason, today());
    });
}

Voucher LedgerService::get_voucher(int64_t company_id, int64_t voucher_id) {
    return run(config_, "get_voucher", [&](pqxx::work& W) {
        return db::load_voucher(W, company_id, voucher_id);
    });
}

money_micro LedgerService::account_balance(int64_t company_id, int64_t account_id, const date& as_of) {
    return run(config_, "account_balance", [&](pqxx::work& W) {
        Account account = db::load_account(W, company_id, account_id);
        return ppl::account_balance(account, db::load_entry_rows(W, company_id, as_of, account.id), as_of);
    });
}

TrialBalance LedgerService::trial_balance(int64_t company_id, const date& as_of) {
    TrialBalance tb = run(config_, "trial_balance", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        AccountIndex accounts(db::load_accounts(W, company_id));
        return ppl::trial_balance(accounts, db::load_entry_rows(W, company_id, as_of), as_of);
    });
    if (!tb.is_balanced) {
        ppl_log("ERROR", "Trial balance for company " + std::to_string(company_id) + " as of " + format_date(as_of) +
                         " is out by " + format_money(tb.total_debit - tb.total_credit) + ".");
    }
    return tb;
}

DayBook LedgerService::daily_summary(int64_t company_id, const date& day) {
    return run(config_, "daily_summary", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        Account cash = db::require_account_by_code(W, company_id, config_.accounts.cash);
        AccountIndex accounts(db::load_accounts(W, company_id));
        return ppl::daily_summary(accounts, db::load_entry_rows(W, company_id, day), cash.id, day);
    });
}

ProfitAndLoss LedgerService::profit_and_loss(int64_t company_id, const std::string& financial_year) {
    return run(config_, "profit_and_loss", [&](pqxx::work& W) {
        Company company = db::load_company(W, company_id);
        FinancialYear year = FinancialYear::from_label(financial_year, company.fiscal_start_month, company.fiscal_start_day);
        AccountIndex accounts(db::load_accounts(W, company_id));
        return ppl::profit_and_loss(accounts, db::load_entry_rows(W, company_id, year.end), year);
    });
}

BalanceSheet LedgerService::balance_sheet(int64_t company_id, const date& as_of) {
    return run(config_, "balance_sheet", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        AccountIndex accounts(db::load_accounts(W, company_id));
        return ppl::balance_sheet(accounts, db::load_entry_rows(W, company_id, as_of), as_of);
    });
}

std::vector<AccountDaySummary> LedgerService::account_wise_summary(int64_t company_id, const date& day) {
    return run(config_, "account_wise_summary", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        AccountIndex accounts(db::load_accounts(W, company_id));
        return ppl::account_wise_summary(accounts, db::load_entry_rows(W, company_id, day), day);
    });
}

std::vector<DaySummary> LedgerService::day_wise_summary(int64_t company_id, const date& from, const date& to) {
    return run(config_, "day_wise_summary", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        return ppl::day_wise_summary(db::load_entry_rows(W, company_id, to), from, to);
    });
}

CustomerStatement LedgerService::customer_statement(int64_t company_id, int64_t customer_id, const date& from, const date& to) {
    return run(config_, "customer_statement", [&](pqxx::work& W) {
        Customer customer = db::load_customer(W, company_id, customer_id);
        if (!customer.coa_account_id) {
            throw referential_error("UnknownAccount", "Customer " + customer.name + " has no ledger account yet.");
        }
        Account account = db::load_account(W, company_id, *customer.coa_account_id);
        return ppl::customer_statement(account, db::load_entry_rows(W, company_id, to, account.id), from, to);
    });
}

DisbursalResult LedgerService::disburse_pledge(const DisbursalRequest& request) {
    return run(config_, "disburse_pledge", [&](pqxx::work& W) {
        return PledgeBook(config_).disburse(W, request);
    });
}

PaymentResult LedgerService::record_payment(const PaymentRequest& request) {
    return run(config_, "record_payment", [&](pqxx::work& W) {
        return PledgeBook(config_).record_payment(W, request, today());
    });
}

PaymentResult LedgerService::update_payment(int64_t payment_id, const PaymentRequest& revised) {
    return run(config_, "update_payment", [&](pqxx::work& W) {
        return PledgeBook(config_).update_payment(W, payment_id, revised, today());
    });
}

DeletionResult LedgerService::delete_payment(int64_t company_id, int64_t payment_id, const std::string& actor) {
    return run(config_, "delete_payment", [&](pqxx::work& W) {
        return PledgeBook(config_).delete_payment(W, company_id, payment_id, actor, today());
    });
}

Modifiability LedgerService::payment_modifiability(int64_t company_id, int64_t payment_id) {
    return run(config_, "payment_modifiability", [&](pqxx::work& W) {
        return PledgeBook(config_).check_modifiable(W, company_id, payment_id, today());
    });
}

SettlementQuote LedgerService::settlement_quote(int64_t company_id, int64_t pledge_id, const date& as_of) {
    return run(config_, "settlement_quote", [&](pqxx::work& W) {
        return PledgeBook(config_).quote(W, company_id, pledge_id, as_of);
    });
}

Pledge LedgerService::get_pledge(int64_t company_id, int64_t pledge_id) {
    return run(config_, "get_pledge", [&](pqxx::work& W) {
        return db::load_pledge(W, company_id, pledge_id);
    });
}

std::vector<Payment> LedgerService::pledge_payments(int64_t company_id, int64_t pledge_id) {
    return run(config_, "pledge_payments", [&](pqxx::work& W) {
        db::load_pledge(W, company_id, pledge_id);
        return db::load_payments(W, company_id, pledge_id);
    });
}

YearEndResult LedgerService::close_year(int64_t company_id, const std::string& financial_year,
                                        const std::string& actor, const std::string& confirmation) {
    require_confirmation(confirmation);
    return run<serializable_work>(config_, "close_year", [&](serializable_work& W) {
        return PeriodClosingEngine(config_.accounts).close_year(W, company_id, financial_year, actor, confirmation, today());
    });
}

YearEndResult LedgerService::open_year(int64_t company_id, const std::string& financial_year,
                                       const std::string& actor, const std::string& confirmation) {
    require_confirmation(confirmation);
    return run<serializable_work>(config_, "open_year", [&](serializable_work& W) {
        return PeriodClosingEngine(config_.accounts).open_year(W, company_id, financial_year, actor, confirmation);
    });
}

SealReport LedgerService::verify_seals(int64_t company_id) {
    SealReport report = run(config_, "verify_seals", [&](pqxx::work& W) {
        db::load_company(W, company_id);
        SealReport r;
        r.company_id = company_id;
        for (const auto& voucher : db::load_vouchers(W, company_id)) {
            r.vouchers_checked++;
            if (!PPLCrypto::verify_seal(voucher)) r.broken.push_back(voucher.id);
        }
        return r;
    });

    if (!report.broken.empty()) {
        ppl_log("ERROR", "Seal check for company " + std::to_string(company_id) + ": " +
                         std::to_string(report.broken.size()) + " voucher(s) fail verification.");
    }
    return report;
}

} // namespace ppl
