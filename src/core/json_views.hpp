/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_views.hpp
 * ============================================================================
 * * DESCRIPTION:
 * JSON shapes for the HTTP front door. Amounts go out as two-decimal
 * strings and come in as decimal strings or whole numbers.
 * ============================================================================
 */

#ifndef PPL_JSON_VIEWS_HPP
#define PPL_JSON_VIEWS_HPP

#include <string>
#include <nlohmann/json.hpp>

#include "accounts.hpp"
#include "balances.hpp"
#include "closing.hpp"
#include "errors.hpp"
#include "ledger_service.hpp"
#include "pledges.hpp"
#include "settlement.hpp"

namespace ppl {

    using json = nlohmann::json;

    void to_json(json& j, const Account& a);
    void to_json(json& j, const LedgerEntry& e);
    void to_json(json& j, const Voucher& v);
    void to_json(json& j, const Pledge& p);
    void to_json(json& j, const Payment& p);
    void to_json(json& j, const TrialBalance& tb);
    void to_json(json& j, const DayBook& book);
    void to_json(json& j, const ProfitAndLoss& pl);
    void to_json(json& j, const BalanceSheet& bs);
    void to_json(json& j, const AccountDaySummary& s);
    void to_json(json& j, const DaySummary& s);
    void to_json(json& j, const CustomerStatement& st);
    void to_json(json& j, const SettlementQuote& q);
    void to_json(json& j, const DisbursalResult& r);
    void to_json(json& j, const PaymentResult& r);
    void to_json(json& j, const DeletionResult& r);
    void to_json(json& j, const Modifiability& m);
    void to_json(json& j, const YearEndResult& r);
    void to_json(json& j, const SealReport& r);

    /**
     * @brief {"error", "code", "kind"}; consistency failures collapse to
     * {"error": "internal ledger error"}.
     */
    json error_body(const LedgerError& e);

    // Decimal string or whole number. Throws LedgerError(InvalidAmount).
    money_micro money_field(const json& body, const std::string& key, bool required = true);

    VoucherDraft voucher_from_json(const json& body, int64_t company_id, const std::string& actor);
    DisbursalRequest disbursal_from_json(const json& body, int64_t company_id, const std::string& actor);
    PaymentRequest payment_from_json(const json& body, int64_t company_id, const std::string& actor);

} // namespace ppl

#endif // PPL_JSON_VIEWS_HPP
