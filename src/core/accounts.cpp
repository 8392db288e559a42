/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: accounts.cpp
 * ============================================================================
 */

#include "accounts.hpp"
#include "chart.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace ppl {

namespace {

bool has_entries(pqxx::transaction_base& tx, int64_t account_id) {
    return tx.exec_params1("SELECT EXISTS (SELECT 1 FROM ledger_entries WHERE account_id = $1)", account_id)[0].as<bool>();
}

} // namespace

std::string to_string(DeactivateOutcome outcome) {
    return outcome == DeactivateOutcome::Deleted ? "deleted" : "deactivated";
}

Account AccountRegistry::create_account(pqxx::transaction_base& tx, int64_t company_id, const std::string& name,
                                        const std::string& code, AccountType type, std::optional<int64_t> parent_id) {
    if (code.empty() || name.empty()) {
        throw validation_error("InvalidArgument", "Account code and name are required.");
    }
    db::load_company(tx, company_id);

    if (parent_id) {
        pqxx::result parent = tx.exec_params("SELECT company_id FROM accounts WHERE id = $1", *parent_id);
        if (parent.empty() || parent[0][0].as<int64_t>() != company_id) {
            throw referential_error("InvalidParent",
                                    "Parent account " + std::to_string(*parent_id) + " does not exist in this company.");
        }
    }

    if (db::find_account_by_code(tx, company_id, code)) {
        throw validation_error("DuplicateCode", "Account code " + code + " already exists.");
    }

    pqxx::row row = tx.exec_params1(
        "INSERT INTO accounts (company_id, code, name, account_type, parent_id) VALUES ($1, $2, $3, $4, $5) RETURNING id",
        company_id, code, name, to_string(type), parent_id);

    Account account;
    account.id = row[0].as<int64_t>();
    account.company_id = company_id;
    account.code = code;
    account.name = name;
    account.type = type;
    account.parent_id = parent_id;
    account.active = true;

    ppl_log("INFO", "Account " + code + " (" + name + ") created for company " + std::to_string(company_id) + ".");
    return account;
}

Account AccountRegistry::get_or_create_customer_subaccount(pqxx::transaction_base& tx, int64_t customer_id, int64_t company_id) {
    Customer customer = db::load_customer(tx, company_id, customer_id, db::RowLock::Update);
    if (customer.coa_account_id) {
        return db::load_account(tx, company_id, *customer.coa_account_id);
    }

    Account parent = db::require_account_by_code(tx, company_id, codes_.customer_parent);

    std::vector<std::string> existing;
    pqxx::result codes = tx.exec_params("SELECT code FROM accounts WHERE company_id = $1 AND parent_id = $2",
                                        company_id, parent.id);
    for (const auto& row : codes) existing.push_back(row[0].as<std::string>());

    long sequence = db::next_sequence(tx, company_id, "account:" + parent.code,
                                      highest_customer_sequence(parent.code, existing));
    Account account = create_account(tx, company_id, customer_account_name(customer.name),
                                     customer_code(parent.code, sequence), parent.type, parent.id);

    tx.exec_params0("UPDATE customers SET coa_account_id = $1 WHERE id = $2", account.id, customer.id);
    return account;
}

Account AccountRegistry::update_account(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id,
                                        const std::string& name, AccountType type) {
    if (name.empty()) {
        throw validation_error("InvalidArgument", "Account name is required.");
    }
    Account account = db::load_account(tx, company_id, account_id);

    if (account.type != type && has_entries(tx, account.id)) {
        throw state_conflict("AccountTypeLocked",
                             "Account " + account.code + " has entries; its type can no longer change.");
    }

    tx.exec_params0("UPDATE accounts SET name = $1, account_type = $2 WHERE id = $3",
                    name, to_string(type), account.id);
    account.name = name;
    account.type = type;
    return account;
}

DeactivateOutcome AccountRegistry::deactivate(pqxx::transaction_base& tx, int64_t company_id, int64_t account_id) {
    Account account = db::load_account(tx, company_id, account_id);

    bool referenced = has_entries(tx, account.id) ||
        tx.exec_params1("SELECT EXISTS (SELECT 1 FROM accounts WHERE parent_id = $1)", account.id)[0].as<bool>() ||
        tx.exec_params1("SELECT EXISTS (SELECT 1 FROM customers WHERE coa_account_id = $1)", account.id)[0].as<bool>();

    if (referenced) {
        tx.exec_params0("UPDATE accounts SET is_active = FALSE WHERE id = $1", account.id);
        ppl_log("INFO", "Account " + account.code + " deactivated.");
        return DeactivateOutcome::Deactivated;
    }

    tx.exec_params0("DELETE FROM accounts WHERE id = $1", account.id);
    ppl_log("INFO", "Account " + account.code + " had no history and was deleted.");
    return DeactivateOutcome::Deleted;
}

int AccountRegistry::initialize_chart(pqxx::transaction_base& tx, int64_t company_id) {
    db::load_company(tx, company_id, db::RowLock::Update);

    int created = 0;
    for (const auto& seed : default_chart()) {
        if (db::find_account_by_code(tx, company_id, seed.code)) continue;
        create_account(tx, company_id, seed.name, seed.code, seed.type, std::nullopt);
        created++;
    }

    ppl_log("INFO", "Chart of accounts initialized for company " + std::to_string(company_id) +
                    ": " + std::to_string(created) + " accounts created.");
    return created;
}

} // namespace ppl
