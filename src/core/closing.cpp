/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: closing.cpp
 * ============================================================================
 */

#include "closing.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "posting.hpp"

#include <map>

namespace ppl {

const char* const kConfirmationToken = "CONFIRM";

namespace {

struct Movement {
    money_micro debit = 0;
    money_micro credit = 0;
};

std::map<int64_t, Movement> movements(const std::vector<EntryRow>& rows, const date& from, const date& to,
                                      bool skip_opening) {
    std::map<int64_t, Movement> result;
    for (const auto& row : rows) {
        if (row.voucher_date < from || row.voucher_date > to) continue;
        if (skip_opening && row.voucher_type == VoucherType::YearOpening) continue;
        result[row.account_id].debit = checked_add(result[row.account_id].debit, row.debit_amount());
        result[row.account_id].credit = checked_add(result[row.account_id].credit, row.credit_amount());
    }
    return result;
}

// Posts the amount on whichever side takes a positive natural balance to zero.
void push_zeroing(std::vector<EntryDraft>& entries, const Account& account, money_micro natural,
                  const std::string& narration) {
    if (natural == 0) return;
    bool debit_side = is_debit_normal(account.type) ? natural < 0 : natural > 0;
    money_micro amount = natural < 0 ? -natural : natural;
    entries.push_back(debit_side ? debit(account.id, amount, narration) : credit(account.id, amount, narration));
}

// Posts the amount on the account's natural side (the contra side when negative).
void push_carry(std::vector<EntryDraft>& entries, const Account& account, money_micro natural,
                const std::string& narration) {
    if (natural == 0) return;
    bool debit_side = is_debit_normal(account.type) ? natural > 0 : natural < 0;
    money_micro amount = natural < 0 ? -natural : natural;
    entries.push_back(debit_side ? debit(account.id, amount, narration) : credit(account.id, amount, narration));
}

YearState load_year_state(pqxx::transaction_base& tx, int64_t company_id, const std::string& label) {
    YearState state;
    pqxx::result r = tx.exec_params("SELECT closed, opened FROM fiscal_years WHERE company_id = $1 AND label = $2",
                                    company_id, label);
    if (!r.empty()) {
        state.closed = r[0][0].as<bool>();
        state.opened = r[0][1].as<bool>();
    }
    state.has_closing_voucher = tx.exec_params1(
        "SELECT EXISTS (SELECT 1 FROM vouchers WHERE company_id = $1 AND voucher_type = 'year_end_closing' AND fiscal_year = $2)",
        company_id, label)[0].as<bool>();
    return state;
}

// Must run before anything else in the transaction so its snapshot is taken
// after every posting that held a company row has committed.
void lock_out_postings(pqxx::transaction_base& tx) {
    tx.exec("LOCK TABLE companies IN EXCLUSIVE MODE");
}

void check_unposted(pqxx::transaction_base& tx, int64_t company_id, const FinancialYear& year) {
    int unposted = db::count_unposted_vouchers(tx, company_id, year.start, year.end);
    if (unposted > 0) {
        throw state_conflict("PendingUnpostedVouchers",
                             std::to_string(unposted) + " voucher(s) in " + year.label() + " have no entries.");
    }
}

} // namespace

void check_closable(const FinancialYear& year, const YearState& state, const date& today) {
    if (state.closed || state.has_closing_voucher) {
        throw state_conflict("AlreadyClosed", "Financial year " + year.label() + " is already closed.");
    }
    if (year.end > today) {
        throw state_conflict("YearNotEnded",
                             "Financial year " + year.label() + " ends on " + format_date(year.end) + ".");
    }
}

void check_openable(const FinancialYear& year, const YearState& prior, const YearState& state) {
    if (!prior.closed) {
        throw state_conflict("PriorYearNotClosed",
                             "Close financial year " + year.previous().label() + " before opening " + year.label() + ".");
    }
    if (state.opened) {
        throw state_conflict("AlreadyOpened", "Financial year " + year.label() + " is already opened.");
    }
}

void require_confirmation(const std::string& token) {
    if (token != kConfirmationToken) {
        throw validation_error("ConfirmationRequired",
                               "This operation cannot be undone. Send admin_confirmation \"CONFIRM\" to proceed.");
    }
}

ClosingPlan build_closing_entries(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                                  const FinancialYear& year, int64_t retained_earnings_id) {
    ClosingPlan plan;
    const std::string suffix = " closed for FY " + year.label();

    std::map<int64_t, Movement> moved = movements(rows, year.start, year.end, true);
    for (const Account* account : accounts.ordered_by_code()) {
        if (account->type != AccountType::Income && account->type != AccountType::Expense) continue;
        auto it = moved.find(account->id);
        if (it == moved.end()) continue;

        money_micro natural = normal_balance(account->type, it->second.debit, it->second.credit);
        if (account->type == AccountType::Income) plan.total_revenue = checked_add(plan.total_revenue, natural);
        else plan.total_expenses = checked_add(plan.total_expenses, natural);

        push_zeroing(plan.entries, *account, natural, account->name + suffix);
    }

    plan.net_profit = plan.total_revenue - plan.total_expenses;
    if (plan.net_profit != 0) {
        const Account& retained = accounts.at(retained_earnings_id);
        std::string narration = plan.net_profit > 0 ? "Net profit for FY " + year.label() : "Net loss for FY " + year.label();
        push_carry(plan.entries, retained, plan.net_profit, narration);
    }
    return plan;
}

OpeningPlan build_opening_entries(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                                  const date& prior_end, int64_t retained_earnings_id) {
    OpeningPlan plan;
    std::map<int64_t, Movement> moved = movements(rows, date(1900, 1, 1), prior_end, true);

    money_micro unclosed_earnings = 0;
    std::map<int64_t, money_micro> natural;
    for (const Account* account : accounts.ordered_by_code()) {
        auto it = moved.find(account->id);
        if (it == moved.end()) continue;
        money_micro balance = normal_balance(account->type, it->second.debit, it->second.credit);

        if (account->type == AccountType::Income) unclosed_earnings = checked_add(unclosed_earnings, balance);
        else if (account->type == AccountType::Expense) unclosed_earnings = checked_add(unclosed_earnings, -balance);
        else natural[account->id] = balance;
    }
    if (unclosed_earnings != 0) {
        accounts.at(retained_earnings_id);
        natural[retained_earnings_id] = checked_add(natural[retained_earnings_id], unclosed_earnings);
    }

    for (const Account* account : accounts.ordered_by_code()) {
        auto it = natural.find(account->id);
        if (it == natural.end()) continue;
        push_carry(plan.entries, *account, it->second, "Opening balance b/f: " + account->name);
    }

    for (const auto& line : plan.entries) {
        if (line.direction == Direction::Debit) plan.total_debit = checked_add(plan.total_debit, line.amount);
        else plan.total_credit = checked_add(plan.total_credit, line.amount);
    }
    if (!within_tolerance(plan.total_debit, plan.total_credit)) {
        ppl_log("ERROR", "Opening balances as of " + format_date(prior_end) + " do not balance: debits " +
                         format_money(plan.total_debit) + ", credits " + format_money(plan.total_credit) + ".");
        throw consistency_error("Opening balances as of " + format_date(prior_end) + " do not balance.");
    }
    return plan;
}

YearEndResult PeriodClosingEngine::close_year(pqxx::transaction_base& tx, int64_t company_id, const std::string& label,
                                              const std::string& actor, const std::string& confirmation, const date& today) {
    require_confirmation(confirmation);
    lock_out_postings(tx);

    Company company = db::load_company(tx, company_id, db::RowLock::Update);
    FinancialYear year = FinancialYear::from_label(label, company.fiscal_start_month, company.fiscal_start_day);

    check_closable(year, load_year_state(tx, company_id, year.label()), today);
    check_unposted(tx, company_id, year);

    Account retained = db::require_account_by_code(tx, company_id, codes_.retained_earnings);
    AccountIndex accounts(db::load_accounts(tx, company_id));
    ClosingPlan plan = build_closing_entries(accounts, db::load_entry_rows(tx, company_id, year.end), year, retained.id);

    YearEndResult result;
    result.financial_year = year.label();
    result.start = year.start;
    result.end = year.end;
    result.net_profit = plan.net_profit;

    if (!plan.entries.empty()) {
        VoucherDraft draft = make_voucher(company_id, VoucherType::YearEndClosing, year.end,
                                          "Year-end closing for FY " + year.label(), actor);
        draft.fiscal_year = year.label();
        draft.entries = plan.entries;
        result.voucher = PostingEngine::post(tx, draft);
    }

    // Every Income and Expense account must now read zero for the year.
    std::vector<EntryRow> after = db::load_entry_rows(tx, company_id, year.end);
    std::map<int64_t, Movement> moved = movements(after, year.start, year.end, true);
    for (const auto& kv : moved) {
        const Account& account = accounts.at(kv.first);
        if (account.type != AccountType::Income && account.type != AccountType::Expense) continue;
        if (kv.second.debit != kv.second.credit) {
            ppl_log("ERROR", "Account " + account.code + " still carries " +
                             format_money(kv.second.debit - kv.second.credit) + " after closing FY " + year.label() + ".");
            throw consistency_error("Closing FY " + year.label() + " left account " + account.code + " non-zero.");
        }
    }

    check_unposted(tx, company_id, year);

    std::optional<int64_t> voucher_id;
    if (result.voucher) voucher_id = result.voucher->id;
    tx.exec_params0(
        "INSERT INTO fiscal_years (company_id, label, start_date, end_date, closed, closing_voucher_id, closed_by, closed_at) "
        "VALUES ($1, $2, $3::date, $4::date, TRUE, $5, $6, CURRENT_TIMESTAMP) "
        "ON CONFLICT (company_id, label) DO UPDATE SET closed = TRUE, closing_voucher_id = EXCLUDED.closing_voucher_id, "
        "closed_by = EXCLUDED.closed_by, closed_at = EXCLUDED.closed_at",
        company_id, year.label(), format_date(year.start), format_date(year.end), voucher_id, actor);

    ppl_log("INFO", "FY " + year.label() + " closed for company " + std::to_string(company_id) + " by " + actor +
                    ". Net result " + format_money(plan.net_profit) + ".");
    return result;
}

YearEndResult PeriodClosingEngine::open_year(pqxx::transaction_base& tx, int64_t company_id, const std::string& label,
                                             const std::string& actor, const std::string& confirmation) {
    require_confirmation(confirmation);
    lock_out_postings(tx);

    Company company = db::load_company(tx, company_id, db::RowLock::Update);
    FinancialYear year = FinancialYear::from_label(label, company.fiscal_start_month, company.fiscal_start_day);
    FinancialYear prior = year.previous();

    check_openable(year, load_year_state(tx, company_id, prior.label()), load_year_state(tx, company_id, year.label()));

    Account retained = db::require_account_by_code(tx, company_id, codes_.retained_earnings);
    AccountIndex accounts(db::load_accounts(tx, company_id));
    OpeningPlan plan = build_opening_entries(accounts, db::load_entry_rows(tx, company_id, prior.end), prior.end, retained.id);

    YearEndResult result;
    result.financial_year = year.label();
    result.start = year.start;
    result.end = year.end;

    if (!plan.entries.empty()) {
        VoucherDraft draft = make_voucher(company_id, VoucherType::YearOpening, year.start,
                                          "Opening balances for FY " + year.label(), actor);
        draft.fiscal_year = year.label();
        draft.entries = plan.entries;
        result.voucher = PostingEngine::post(tx, draft);
    }

    std::optional<int64_t> voucher_id;
    if (result.voucher) voucher_id = result.voucher->id;
    tx.exec_params0(
        "INSERT INTO fiscal_years (company_id, label, start_date, end_date, opened, opening_voucher_id, opened_by, opened_at) "
        "VALUES ($1, $2, $3::date, $4::date, TRUE, $5, $6, CURRENT_TIMESTAMP) "
        "ON CONFLICT (company_id, label) DO UPDATE SET opened = TRUE, opening_voucher_id = EXCLUDED.opening_voucher_id, "
        "opened_by = EXCLUDED.opened_by, opened_at = EXCLUDED.opened_at",
        company_id, year.label(), format_date(year.start), format_date(year.end), voucher_id, actor);

    ppl_log("INFO", "FY " + year.label() + " opened for company " + std::to_string(company_id) + " by " + actor +
                    " with " + std::to_string(plan.entries.size()) + " carried balances.");
    return result;
}

} // namespace ppl
