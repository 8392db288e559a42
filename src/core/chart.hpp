/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: chart.hpp
 * ============================================================================
 * * DESCRIPTION:
 * In-memory chart of accounts. Accounts live in one arena keyed by id;
 * the tree is a parent_id on each row and children are found by filtering.
 * ============================================================================
 */

#ifndef PPL_CHART_HPP
#define PPL_CHART_HPP

#include <map>
#include <string>
#include <vector>

#include "model.hpp"

namespace ppl {

    struct ChartSeed {
        std::string code;
        std::string name;
        AccountType type;
    };

    /**
     * @brief The standard pawn-broking chart created by
     * initialize_chart_of_accounts.
     */
    const std::vector<ChartSeed>& default_chart();

    // Highest NNN among "<parent>-NNN" codes, 0 when there is none.
    long highest_customer_sequence(const std::string& parent_code, const std::vector<std::string>& existing_codes);

    // "2001-007"
    std::string customer_code(const std::string& parent_code, long sequence);

    std::string customer_account_name(const std::string& customer_name);

    class AccountIndex {
    public:
        AccountIndex() {}
        explicit AccountIndex(const std::vector<Account>& accounts);

        // Throws LedgerError(DuplicateCode) when the code is already indexed.
        void add(const Account& account);

        // Throws LedgerError(UnknownAccount).
        const Account& at(int64_t id) const;

        const Account* find(int64_t id) const;
        const Account* find_code(const std::string& code) const;

        std::vector<const Account*> children(int64_t parent_id) const;
        std::vector<const Account*> ordered_by_code() const;

        std::size_t size() const { return by_id_.size(); }

    private:
        std::map<int64_t, Account> by_id_;
        std::map<std::string, int64_t> by_code_;
    };

} // namespace ppl

#endif // PPL_CHART_HPP
