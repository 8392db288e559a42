/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "json_views.hpp"
#include "ledger_service.hpp"
#include "logger.hpp"

using json = nlohmann::json;
using ppl::ppl_log;

namespace {

bool is_admin(const httplib::Request &req) {
    if (req.has_header("Remote-Groups")) {
        std::string groups = req.get_header_value("Remote-Groups");
        return groups.find("admins") != std::string::npos;
    }
    return false;
}

bool is_authenticated(const httplib::Request &req) {
    return req.has_header("Remote-User") && !req.get_header_value("Remote-User").empty();
}

std::string actor_of(const httplib::Request &req) {
    return req.get_header_value("Remote-User");
}

int64_t parse_id(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        long long id = std::stoll(text, &used);
        if (used == text.size() && id > 0) return id;
    } catch (const std::logic_error&) {
        // falls through to the validation error below
    }
    throw ppl::validation_error("InvalidArgument", std::string(what) + " must be a positive integer.");
}

int64_t company_of(const httplib::Request &req) {
    if (!req.has_header("Remote-Company")) {
        throw ppl::validation_error("InvalidArgument", "Remote-Company header is required.");
    }
    return parse_id(req.get_header_value("Remote-Company"), "Remote-Company");
}

int64_t path_id(const httplib::Request &req) {
    return parse_id(req.matches[1].str(), "Path id");
}

ppl::date query_date(const httplib::Request &req, const char* key) {
    if (!req.has_param(key)) return ppl::today();
    return ppl::parse_date(req.get_param_value(key));
}

json body_of(const httplib::Request &req) {
    if (req.body.empty()) return json::object();
    return json::parse(req.body);
}

void reply(httplib::Response &res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

/**
 * Runs a route body with the shared auth check and error mapping. Ledger
 * errors answer with their own status; anything else is a 500 that never
 * leaks its detail.
 */
template <typename Fn>
void handle(const httplib::Request &req, httplib::Response &res, Fn fn) {
    if (!is_authenticated(req)) {
        res.status = 401;
        res.set_content("{\"error\":\"Secure Gateway Login Required\"}", "application/json");
        return;
    }
    try {
        fn();
    } catch (const ppl::LedgerError &e) {
        reply(res, ppl::error_body(e), e.http_status());
    } catch (const json::exception &e) {
        ppl_log("WARN", "Malformed request body on " + req.path + ": " + std::string(e.what()));
        reply(res, {{"error", "Malformed JSON body."}, {"code", "InvalidArgument"}}, 400);
    } catch (const std::exception &e) {
        ppl_log("ERROR", req.method + " " + req.path + " failed: " + std::string(e.what()));
        reply(res, {{"error", "internal ledger error"}}, 500);
    }
}

} // namespace

int main() {
    ppl::LedgerConfig config;
    try {
        config = ppl::LedgerConfig::from_environment();
    } catch (const ppl::LedgerError &e) {
        ppl_log("FATAL", "Configuration rejected: " + std::string(e.what()));
        return 1;
    }
    if (config.db_conn.empty()) {
        ppl_log("FATAL", "Database connection variable missing. System halted.");
        return 1;
    }

    ppl::LedgerService ledger(config);
    try {
        ledger.ensure_schema();
    } catch (const std::exception &e) {
        ppl_log("FATAL", "Database schema could not be applied: " + std::string(e.what()));
        return 1;
    }

    httplib::Server svr;
    ppl_log("INFO", "PawnPro Ledger: Engine Active.");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        std::string log_msg = "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status);
        ppl_log("INFO", log_msg);
    });

    svr.Get("/api/health", [&](const httplib::Request &, httplib::Response &res) {
        reply(res, {{"status", "ok"}, {"service", "ppl_engine"}});
    });

    // === [SEARCH: MASTER DATA] ===
    svr.Post("/api/companies", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) { res.status = 403; return; }
        handle(req, res, [&] {
            auto j = body_of(req);
            ppl::Company company = ledger.create_company(j.at("code").get<std::string>(), j.at("name").get<std::string>(),
                                                         j.value("fiscal_start_month", 4), j.value("fiscal_start_day", 1));
            reply(res, {{"id", company.id}, {"code", company.code}, {"name", company.name},
                       {"fiscal_start_month", company.fiscal_start_month},
                       {"fiscal_start_day", company.fiscal_start_day}}, 201);
        });
    });

    svr.Post("/api/customers", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            auto j = body_of(req);
            ppl::Customer customer = ledger.create_customer(company_of(req), j.at("name").get<std::string>());
            reply(res, {{"id", customer.id}, {"name", customer.name}}, 201);
        });
    });

    svr.Post("/api/schemes", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            auto j = body_of(req);
            ppl::Scheme scheme = ledger.create_scheme(company_of(req), j.at("name").get<std::string>(),
                                                      j.value("prefix", std::string("PL")),
                                                      ppl::parse_rate_percent(j.at("interest_rate").get<std::string>()),
                                                      j.value("duration_months", 12));
            reply(res, {{"id", scheme.id}, {"name", scheme.name}, {"prefix", scheme.prefix},
                       {"interest_rate", ppl::format_rate_percent(scheme.monthly_rate)},
                       {"duration_months", scheme.duration_months}}, 201);
        });
    });

    // === [SEARCH: CHART OF ACCOUNTS] ===
    svr.Post("/api/coa/initialize", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            int created = ledger.initialize_chart_of_accounts(company_of(req));
            reply(res, {{"status", "SUCCESS"}, {"created", created}});
        });
    });

    svr.Get("/api/accounts", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.list_accounts(company_of(req)));
        });
    });

    svr.Post("/api/accounts", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            auto j = body_of(req);
            std::optional<int64_t> parent;
            if (j.contains("parent_id") && !j.at("parent_id").is_null()) parent = j.at("parent_id").get<int64_t>();
            ppl::Account account = ledger.create_account(company_of(req), j.at("name").get<std::string>(),
                                                         j.at("code").get<std::string>(),
                                                         ppl::parse_account_type(j.at("account_type").get<std::string>()),
                                                         parent);
            reply(res, account, 201);
        });
    });

    svr.Put(R"(/api/accounts/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            auto j = body_of(req);
            reply(res, ledger.update_account(company_of(req), path_id(req), j.at("name").get<std::string>(),
                                            ppl::parse_account_type(j.at("account_type").get<std::string>())));
        });
    });

    svr.Post(R"(/api/accounts/(\d+)/deactivate)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::DeactivateOutcome outcome = ledger.deactivate_account(company_of(req), path_id(req));
            reply(res, {{"status", "SUCCESS"}, {"outcome", ppl::to_string(outcome)}});
        });
    });

    svr.Get(R"(/api/accounts/(\d+)/balance)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::date as_of = query_date(req, "as_of");
            int64_t account_id = path_id(req);
            ppl::money_micro balance = ledger.account_balance(company_of(req), account_id, as_of);
            reply(res, {{"account_id", account_id}, {"as_of", ppl::format_date(as_of)},
                       {"balance", ppl::format_money(balance)}});
        });
    });

    svr.Get(R"(/api/customers/(\d+)/account)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.customer_account(company_of(req), path_id(req)));
        });
    });

    // === [SEARCH: VOUCHERS] ===
    svr.Post("/api/vouchers", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::VoucherDraft draft = ppl::voucher_from_json(body_of(req), company_of(req), actor_of(req));
            reply(res, ledger.post_voucher(draft), 201);
        });
    });

    svr.Get(R"(/api/vouchers/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.get_voucher(company_of(req), path_id(req)));
        });
    });

    svr.Post(R"(/api/vouchers/(\d+)/reverse)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            auto j = body_of(req);
            reply(res, ledger.reverse_voucher(company_of(req), path_id(req), actor_of(req),
                                             j.value("reason", std::string())), 201);
        });
    });

    // === [SEARCH: PLEDGES & PAYMENTS] ===
    svr.Post("/api/pledges", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::DisbursalRequest request = ppl::disbursal_from_json(body_of(req), company_of(req), actor_of(req));
            reply(res, ledger.disburse_pledge(request), 201);
        });
    });

    svr.Get(R"(/api/pledges/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            int64_t company_id = company_of(req);
            int64_t pledge_id = path_id(req);
            json response;
            response["pledge"] = ledger.get_pledge(company_id, pledge_id);
            response["payments"] = ledger.pledge_payments(company_id, pledge_id);
            reply(res, response);
        });
    });

    svr.Get(R"(/api/pledges/(\d+)/settlement)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.settlement_quote(company_of(req), path_id(req), query_date(req, "as_of")));
        });
    });

    svr.Post(R"(/api/pledges/(\d+)/payments)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::PaymentRequest request = ppl::payment_from_json(body_of(req), company_of(req), actor_of(req));
            request.pledge_id = path_id(req);
            reply(res, ledger.record_payment(request), 201);
        });
    });

    svr.Put(R"(/api/payments/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            ppl::PaymentRequest revised = ppl::payment_from_json(body_of(req), company_of(req), actor_of(req));
            reply(res, ledger.update_payment(path_id(req), revised));
        });
    });

    svr.Delete(R"(/api/payments/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.delete_payment(company_of(req), path_id(req), actor_of(req)));
        });
    });

    svr.Get(R"(/api/payments/(\d+)/modifiable)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.payment_modifiability(company_of(req), path_id(req)));
        });
    });

    // === [SEARCH: REPORTS] ===
    svr.Get("/api/reports/trial-balance", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.trial_balance(company_of(req), query_date(req, "as_of")));
        });
    });

    svr.Get("/api/reports/profit-loss", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            if (!req.has_param("financial_year")) {
                throw ppl::validation_error("InvalidArgument", "financial_year is required, e.g. 2024-25.");
            }
            reply(res, ledger.profit_and_loss(company_of(req), req.get_param_value("financial_year")));
        });
    });

    svr.Get("/api/reports/balance-sheet", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.balance_sheet(company_of(req), query_date(req, "as_of")));
        });
    });

    svr.Get("/api/reports/daybook", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.daily_summary(company_of(req), query_date(req, "date")));
        });
    });

    svr.Get("/api/reports/account-summary", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.account_wise_summary(company_of(req), query_date(req, "date")));
        });
    });

    svr.Get("/api/reports/day-range", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.day_wise_summary(company_of(req), query_date(req, "from"), query_date(req, "to")));
        });
    });

    svr.Get(R"(/api/customers/(\d+)/statement)", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.customer_statement(company_of(req), path_id(req),
                                                query_date(req, "from"), query_date(req, "to")));
        });
    });

    // === [SEARCH: FINANCIAL YEAR GATE] ===
    svr.Post("/api/financial-year/close", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) { res.status = 403; return; }
        handle(req, res, [&] {
            auto j = body_of(req);
            ppl::YearEndResult result = ledger.close_year(company_of(req), j.at("financial_year").get<std::string>(),
                                                          actor_of(req), j.value("admin_confirmation", std::string()));
            ppl_log("CRITICAL", "User " + actor_of(req) + " closed financial year " + result.financial_year + ".");
            reply(res, result);
        });
    });

    svr.Post("/api/financial-year/open", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) { res.status = 403; return; }
        handle(req, res, [&] {
            auto j = body_of(req);
            ppl::YearEndResult result = ledger.open_year(company_of(req), j.at("financial_year").get<std::string>(),
                                                         actor_of(req), j.value("admin_confirmation", std::string()));
            ppl_log("CRITICAL", "User " + actor_of(req) + " opened financial year " + result.financial_year + ".");
            reply(res, result);
        });
    });

    // === [SEARCH: AUDIT] ===
    svr.Get("/api/audit/seals", [&](const httplib::Request &req, httplib::Response &res) {
        handle(req, res, [&] {
            reply(res, ledger.verify_seals(company_of(req)));
        });
    });

    svr.Get("/api/system/logs", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) {
            ppl_log("WARN", "Unauthorized log access blocked.");
            res.status = 403;
            res.set_content("{\"error\":\"Action Requires Administrator Privileges.\"}", "application/json");
            return;
        }

        json response;
        response["logs"] = ppl::recent_logs();
        res.set_content(response.dump(), "application/json");
    });

    // === [SEARCH: SERVER INITIALIZATION] ===
    ppl_log("INFO", "PawnPro Ledger running on " + config.listen_host + ":" + std::to_string(config.listen_port));

    if (!svr.listen(config.listen_host.c_str(), config.listen_port)) {
        ppl_log("FATAL", "Could not bind " + config.listen_host + ":" + std::to_string(config.listen_port) + ".");
        return 1;
    }
    return 0;
}
