/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Service configuration. Built once at startup from the environment and an
 * optional JSON file, then handed to LedgerService by value. Nothing in the
 * engine reads settings from anywhere else.
 * ============================================================================
 */

#ifndef PPL_CONFIG_HPP
#define PPL_CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace ppl {

    /**
     * @brief Codes of the fixed accounts the engine posts to.
     */
    struct AccountCodes {
        std::string cash = "1001";
        std::string bank = "1002";
        std::string customer_parent = "2001";
        std::string retained_earnings = "3003";
        std::string interest_income = "4001";
        std::string document_income = "4002";
        std::string penalty_income = "4005";
        std::string discount_expense = "5008";
    };

    struct LedgerConfig {
        std::string db_conn;
        std::string listen_host = "0.0.0.0";
        int listen_port = 8080;
        std::string config_path = "/app/core/config/ppl_config.json";

        AccountCodes accounts;

        int payment_update_window_days = 30;
        int payment_delete_window_days = 7;

        std::size_t log_capacity = 200;

        /**
         * from_environment
         * Reads PPL_DB_CONN, PPL_HOST, PPL_PORT and PPL_CONFIG, then overlays
         * the JSON file at config_path when it exists.
         */
        static LedgerConfig from_environment();

        /**
         * @brief Overlays the keys present in the document; absent keys keep
         * their current value. Throws LedgerError(InvalidArgument) on a
         * wrongly typed or out-of-range value.
         */
        void apply_json(const nlohmann::json& doc);

        /**
         * @return false when the file does not exist. A file that exists but
         * does not parse throws LedgerError(InvalidArgument).
         */
        bool load_file(const std::string& path);

        nlohmann::json to_json() const;
    };

} // namespace ppl

#endif // PPL_CONFIG_HPP
