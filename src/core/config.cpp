/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace ppl {

namespace {

int parse_port(const std::string& text) {
    try {
        std::size_t used = 0;
        int port = std::stoi(text, &used);
        if (used == text.size() && port > 0 && port < 65536) return port;
    } catch (const std::exception&) {
    }
    throw validation_error("InvalidArgument", "Invalid listen port: '" + text + "'");
}

void read_string(const json& section, const char* key, std::string& target) {
    if (section.contains(key)) target = section.at(key).get<std::string>();
}

void read_window(const json& section, const char* key, int& target) {
    if (!section.contains(key)) return;
    int days = section.at(key).get<int>();
    if (days < 0) {
        throw validation_error("InvalidArgument", std::string("payments.") + key + " cannot be negative.");
    }
    target = days;
}

} // namespace

LedgerConfig LedgerConfig::from_environment() {
    LedgerConfig config;

    if (const char* env_db = std::getenv("PPL_DB_CONN")) config.db_conn = env_db;
    if (const char* env_host = std::getenv("PPL_HOST")) config.listen_host = env_host;
    if (const char* env_port = std::getenv("PPL_PORT")) config.listen_port = parse_port(env_port);
    if (const char* env_cfg = std::getenv("PPL_CONFIG")) config.config_path = env_cfg;

    if (!config.load_file(config.config_path)) {
        ppl_log("WARN", "Config file " + config.config_path + " missing. Using system defaults.");
    }

    // The environment wins over the file for the connection string.
    if (const char* env_db = std::getenv("PPL_DB_CONN")) config.db_conn = env_db;
    return config;
}

void LedgerConfig::apply_json(const json& doc) {
    try {
        if (doc.contains("database")) {
            read_string(doc.at("database"), "connection", db_conn);
        }
        if (doc.contains("server")) {
            const json& server = doc.at("server");
            read_string(server, "host", listen_host);
            if (server.contains("port")) {
                int port = server.at("port").get<int>();
                if (port <= 0 || port >= 65536) {
                    throw validation_error("InvalidArgument", "server.port out of range.");
                }
                listen_port = port;
            }
        }
        if (doc.contains("accounts")) {
            const json& codes = doc.at("accounts");
            read_string(codes, "cash", accounts.cash);
            read_string(codes, "bank", accounts.bank);
            read_string(codes, "customer_parent", accounts.customer_parent);
            read_string(codes, "retained_earnings", accounts.retained_earnings);
            read_string(codes, "interest_income", accounts.interest_income);
            read_string(codes, "document_income", accounts.document_income);
            read_string(codes, "penalty_income", accounts.penalty_income);
            read_string(codes, "discount_expense", accounts.discount_expense);
        }
        if (doc.contains("payments")) {
            const json& payments = doc.at("payments");
            read_window(payments, "update_window_days", payment_update_window_days);
            read_window(payments, "delete_window_days", payment_delete_window_days);
        }
        if (doc.contains("logging") && doc.at("logging").contains("capacity")) {
            log_capacity = doc.at("logging").at("capacity").get<std::size_t>();
        }
    } catch (const json::exception& e) {
        throw validation_error("InvalidArgument", std::string("Invalid configuration: ") + e.what());
    }
}

bool LedgerConfig::load_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;

    json doc;
    try {
        doc = json::parse(ifs);
    } catch (const json::parse_error& e) {
        ppl_log("ERROR", "Config Parse Error: " + std::string(e.what()));
        throw validation_error("InvalidArgument", "Configuration file " + path + " is corrupt.");
    }
    apply_json(doc);
    ppl_log("INFO", "Configuration loaded from " + path);
    return true;
}

json LedgerConfig::to_json() const {
    // The connection string is never echoed back.
    return {
        {"server", {{"host", listen_host}, {"port", listen_port}}},
        {"accounts", {
            {"cash", accounts.cash},
            {"bank", accounts.bank},
            {"customer_parent", accounts.customer_parent},
            {"retained_earnings", accounts.retained_earnings},
            {"interest_income", accounts.interest_income},
            {"document_income", accounts.document_income},
            {"penalty_income", accounts.penalty_income},
            {"discount_expense", accounts.discount_expense}
        }},
        {"payments", {
            {"update_window_days", payment_update_window_days},
            {"delete_window_days", payment_delete_window_days}
        }},
        {"logging", {{"capacity", log_capacity}}}
    };
}

} // namespace ppl
