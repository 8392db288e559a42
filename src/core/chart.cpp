/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: chart.cpp
 * ============================================================================
 */

#include "chart.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace ppl {

const std::vector<ChartSeed>& default_chart() {
    static const std::vector<ChartSeed> chart = {
        {"1001", "Cash in Hand", AccountType::Asset},
        {"1002", "Cash at Bank", AccountType::Asset},
        {"1005", "Pledged Ornaments", AccountType::Asset},
        {"2001", "Customer Liabilities", AccountType::Liability},
        {"2010", "Bank Loans", AccountType::Liability},
        {"2020", "Sundry Creditors", AccountType::Liability},
        {"3001", "Capital Account", AccountType::Equity},
        {"3002", "Reserves", AccountType::Equity},
        {"3003", "Retained Earnings", AccountType::Equity},
        {"4001", "Interest Income", AccountType::Income},
        {"4002", "Document Charges Income", AccountType::Income},
        {"4003", "Service Charges", AccountType::Income},
        {"4005", "Penalty Income", AccountType::Income},
        {"4010", "Auction Income", AccountType::Income},
        {"4020", "Other Income", AccountType::Income},
        {"5001", "Salaries and Wages", AccountType::Expense},
        {"5002", "Rent Expense", AccountType::Expense},
        {"5003", "Electricity Expense", AccountType::Expense},
        {"5004", "Interest Expense", AccountType::Expense},
        {"5008", "Discount Allowed", AccountType::Expense},
        {"5010", "Office Expenses", AccountType::Expense},
        {"5020", "Bank Charges", AccountType::Expense},
        {"5030", "Depreciation", AccountType::Expense}
    };
    return chart;
}

long highest_customer_sequence(const std::string& parent_code, const std::vector<std::string>& existing_codes) {
    const std::string prefix = parent_code + "-";
    long highest = 0;

    for (const auto& code : existing_codes) {
        if (code.size() <= prefix.size() || code.compare(0, prefix.size(), prefix) != 0) continue;

        std::string suffix = code.substr(prefix.size());
        bool numeric = std::all_of(suffix.begin(), suffix.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (!numeric || suffix.size() > 9) continue;
        highest = std::max(highest, std::stol(suffix));
    }
    return highest;
}

std::string customer_code(const std::string& parent_code, long sequence) {
    std::string number = std::to_string(sequence);
    if (number.size() < 3) number.insert(0, 3 - number.size(), '0');
    return parent_code + "-" + number;
}

std::string customer_account_name(const std::string& customer_name) {
    return "Customer - " + customer_name;
}

AccountIndex::AccountIndex(const std::vector<Account>& accounts) {
    for (const auto& account : accounts) add(account);
}

void AccountIndex::add(const Account& account) {
    if (by_code_.count(account.code)) {
        throw validation_error("DuplicateCode", "Account code " + account.code + " already exists.");
    }
    by_id_[account.id] = account;
    by_code_[account.code] = account.id;
}

const Account& AccountIndex::at(int64_t id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        throw referential_error("UnknownAccount", "Account " + std::to_string(id) + " does not exist.");
    }
    return it->second;
}

const Account* AccountIndex::find(int64_t id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : &it->second;
}

const Account* AccountIndex::find_code(const std::string& code) const {
    auto it = by_code_.find(code);
    return it == by_code_.end() ? nullptr : find(it->second);
}

std::vector<const Account*> AccountIndex::children(int64_t parent_id) const {
    std::vector<const Account*> result;
    for (const auto& kv : by_id_) {
        if (kv.second.parent_id && *kv.second.parent_id == parent_id) result.push_back(&kv.second);
    }
    std::sort(result.begin(), result.end(), [](const Account* a, const Account* b) { return a->code < b->code; });
    return result;
}

std::vector<const Account*> AccountIndex::ordered_by_code() const {
    std::vector<const Account*> result;
    for (const auto& kv : by_code_) result.push_back(&by_id_.at(kv.second));
    return result;
}

} // namespace ppl
