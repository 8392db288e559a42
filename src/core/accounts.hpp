/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: accounts.hpp
 * ============================================================================
 */

#ifndef PPL_ACCOUNTS_HPP
#define PPL_ACCOUNTS_HPP

#include <optional>
#include <string>
#include <pqxx/pqxx>

#include "config.hpp"
#include "model.hpp"

namespace ppl {

    enum class DeactivateOutcome {
        Deactivated,    // has history, kept for audit
        Deleted         // never used, removed
    };

    std::string to_string(DeactivateOutcome outcome);

    /**
     * @brief Chart of accounts persistence for one company at a time.
     */
    class AccountRegistry {
    public:
        explicit AccountRegistry(const AccountCodes& codes) : codes_(codes) {}

        /**
         * @brief Throws DuplicateCode, or InvalidParent when the parent is
         * missing or owned by another company.
         */
        Account create_account(pqxx::transaction_base& tx, int64_t company_id, const std::string& name,
                               const std::string& code, AccountType type, std::optional<int64_t> parent_id);

        /**
         * get_or_create_customer_subaccount
         * Returns the customer's existing sub-account, or allocates the next
         * "2001-NNN" code under Customer Liabilities and links it on the
         * customer row. The customer row is locked so two callers cannot
         * both allocate.
         */
        Account get_or_create_customer_subaccount(pqxx::transaction_base& tx, int64_t customer_id, int64_t company_id);

        /**
         * @brief Renames, and retypes only while the account has no entries
         * (AccountTypeLocked otherwise).
         */
        Account update_account(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id,
                               const std::string& name, AccountType type);

        /**
         * deactivate
         * An account with entries, children or a customer link is only
         * deactivated. One with no history is deleted outright.
         */
        DeactivateOutcome deactivate(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id);

        /**
         * @return number of accounts created; existing codes are left alone.
         */
        int initialize_chart(pqxx::transaction_base& tx, int64_t company_id);

    private:
        AccountCodes codes_;
    };

} // namespace ppl

#endif // PPL_ACCOUNTS_HPP
