/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: balances.cpp
 * ============================================================================
 */

#include "balances.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>

namespace ppl {

namespace {

struct Totals {
    money_micro debit = 0;
    money_micro credit = 0;
    int count = 0;
};

bool counts_cumulatively(const EntryRow& row) {
    return row.voucher_type != VoucherType::YearOpening;
}

std::map<int64_t, Totals> totals_by_account(const std::vector<EntryRow>& rows, const date& from, const date& to,
                                            bool skip_opening, bool skip_closing) {
    std::map<int64_t, Totals> totals;
    for (const auto& row : rows) {
        if (row.voucher_date < from || row.voucher_date > to) continue;
        if (skip_opening && row.voucher_type == VoucherType::YearOpening) continue;
        if (skip_closing && row.voucher_type == VoucherType::YearEndClosing) continue;

        Totals& t = totals[row.account_id];
        t.debit = checked_add(t.debit, row.debit_amount());
        t.credit = checked_add(t.credit, row.credit_amount());
        t.count++;
    }
    return totals;
}

const date kBeginningOfTime(1900, 1, 1);

StatementLine statement_line(const Account& account, money_micro amount) {
    StatementLine line;
    line.account_id = account.id;
    line.code = account.code;
    line.name = account.name;
    line.amount = amount;
    return line;
}

} // namespace

void sort_for_reporting(std::vector<EntryRow>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const EntryRow& a, const EntryRow& b) {
        if (a.voucher_date != b.voucher_date) return a.voucher_date < b.voucher_date;
        if (a.voucher_id != b.voucher_id) return a.voucher_id < b.voucher_id;
        return a.entry_id < b.entry_id;
    });
}

money_micro normal_balance(AccountType type, money_micro debit, money_micro credit) {
    return is_debit_normal(type) ? debit - credit : credit - debit;
}

money_micro account_balance(const Account& account, const std::vector<EntryRow>& rows, const date& as_of) {
    money_micro debit = 0;
    money_micro credit = 0;
    for (const auto& row : rows) {
        if (row.account_id != account.id || row.voucher_date > as_of || !counts_cumulatively(row)) continue;
        debit = checked_add(debit, row.debit_amount());
        credit = checked_add(credit, row.credit_amount());
    }
    return normal_balance(account.type, debit, credit);
}

TrialBalance trial_balance(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& as_of) {
    TrialBalance tb;
    tb.as_of = as_of;

    std::map<int64_t, Totals> totals = totals_by_account(rows, kBeginningOfTime, as_of, true, false);
    for (const auto& kv : totals) {
        accounts.at(kv.first); // every posted account must be known
    }

    for (const Account* account : accounts.ordered_by_code()) {
        auto it = totals.find(account->id);
        money_micro net = it == totals.end() ? 0 : it->second.debit - it->second.credit;
        if (!account->active && net == 0) continue;

        TrialBalanceLine line;
        line.account_id = account->id;
        line.code = account->code;
        line.name = account->name;
        line.type = account->type;
        line.active = account->active;
        line.debit = net > 0 ? net : 0;
        line.credit = net < 0 ? -net : 0;

        tb.total_debit = checked_add(tb.total_debit, line.debit);
        tb.total_credit = checked_add(tb.total_credit, line.credit);
        tb.lines.push_back(line);
    }

    tb.is_balanced = within_tolerance(tb.total_debit, tb.total_credit);
    return tb;
}

DayBook daily_summary(const AccountIndex& accounts, const std::vector<EntryRow>& rows,
                      int64_t cash_account_id, const date& day) {
    DayBook book;
    book.day = day;

    std::vector<EntryRow> todays;
    for (const auto& row : rows) {
        if (!counts_cumulatively(row)) continue;
        if (row.voucher_date < day) {
            if (row.account_id == cash_account_id) {
                book.opening_balance = checked_add(book.opening_balance, row.debit_amount() - row.credit_amount());
            }
        } else if (row.voucher_date == day) {
            todays.push_back(row);
        }
    }

    std::stable_sort(todays.begin(), todays.end(), [](const EntryRow& a, const EntryRow& b) {
        if (a.voucher_id != b.voucher_id) return a.voucher_id < b.voucher_id;
        return a.entry_id < b.entry_id;
    });

    money_micro running = book.opening_balance;
    for (const auto& row : todays) {
        if (row.account_id == cash_account_id) {
            running = checked_add(running, row.debit_amount() - row.credit_amount());
            book.cash_in = checked_add(book.cash_in, row.debit_amount());
            book.cash_out = checked_add(book.cash_out, row.credit_amount());
        }
        book.total_debit = checked_add(book.total_debit, row.debit_amount());
        book.total_credit = checked_add(book.total_credit, row.credit_amount());

        const Account& account = accounts.at(row.account_id);
        DayBookLine line;
        line.entry = row;
        line.account_code = account.code;
        line.account_name = account.name;
        line.running_balance = running;
        book.entries.push_back(line);
    }

    book.closing_balance = running;
    return book;
}

ProfitAndLoss profit_and_loss(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const FinancialYear& year) {
    ProfitAndLoss pl;
    pl.financial_year = year.label();
    pl.from = year.start;
    pl.to = year.end;

    std::map<int64_t, Totals> totals = totals_by_account(rows, year.start, year.end, false, true);

    for (const Account* account : accounts.ordered_by_code()) {
        if (account->type != AccountType::Income && account->type != AccountType::Expense) continue;
        auto it = totals.find(account->id);
        if (it == totals.end()) continue;

        money_micro amount = normal_balance(account->type, it->second.debit, it->second.credit);
        if (account->type == AccountType::Income) {
            pl.revenue.push_back(statement_line(*account, amount));
            pl.total_revenue = checked_add(pl.total_revenue, amount);
        } else {
            pl.expenses.push_back(statement_line(*account, amount));
            pl.total_expenses = checked_add(pl.total_expenses, amount);
        }
    }

    pl.net_profit = pl.total_revenue - pl.total_expenses;
    return pl;
}

BalanceSheet balance_sheet(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& as_of) {
    BalanceSheet bs;
    bs.as_of = as_of;

    std::map<int64_t, Totals> totals = totals_by_account(rows, kBeginningOfTime, as_of, true, false);

    for (const Account* account : accounts.ordered_by_code()) {
        auto it = totals.find(account->id);
        if (it == totals.end()) continue;

        money_micro amount = normal_balance(account->type, it->second.debit, it->second.credit);
        switch (account->type) {
            case AccountType::Asset:
                if (amount != 0) bs.assets.push_back(statement_line(*account, amount));
                bs.total_assets = checked_add(bs.total_assets, amount);
                break;
            case AccountType::Liability:
                if (amount != 0) bs.liabilities.push_back(statement_line(*account, amount));
                bs.total_liabilities = checked_add(bs.total_liabilities, amount);
                break;
            case AccountType::Equity:
                if (amount != 0) bs.equity.push_back(statement_line(*account, amount));
                bs.total_equity = checked_add(bs.total_equity, amount);
                break;
            case AccountType::Income:
                bs.current_earnings = checked_add(bs.current_earnings, amount);
                break;
            case AccountType::Expense:
                bs.current_earnings = checked_add(bs.current_earnings, -amount);
                break;
        }
    }

    bs.total_equity = checked_add(bs.total_equity, bs.current_earnings);
    bs.is_balanced = within_tolerance(bs.total_assets, bs.total_liabilities + bs.total_equity);
    return bs;
}

std::vector<AccountDaySummary> account_wise_summary(const AccountIndex& accounts, const std::vector<EntryRow>& rows, const date& day) {
    std::map<int64_t, Totals> totals = totals_by_account(rows, day, day, true, false);

    std::vector<AccountDaySummary> result;
    for (const auto& kv : totals) {
        const Account& account = accounts.at(kv.first);
        AccountDaySummary s;
        s.account_id = account.id;
        s.code = account.code;
        s.name = account.name;
        s.type = account.type;
        s.debit = kv.second.debit;
        s.credit = kv.second.credit;
        s.net = normal_balance(account.type, s.debit, s.credit);
        s.entry_count = kv.second.count;
        result.push_back(s);
    }

    std::sort(result.begin(), result.end(), [](const AccountDaySummary& a, const AccountDaySummary& b) {
        return a.code < b.code;
    });
    return result;
}

std::vector<DaySummary> day_wise_summary(const std::vector<EntryRow>& rows, const date& from, const date& to) {
    if (from > to) {
        throw validation_error("InvalidDateRange", "Range start " + format_date(from) + " is after its end " + format_date(to) + ".");
    }

    std::map<date, DaySummary> days;
    std::map<date, std::set<int64_t>> seen;

    for (const auto& row : rows) {
        if (row.voucher_date < from || row.voucher_date > to) continue;

        DaySummary& s = days[row.voucher_date];
        s.day = row.voucher_date;
        s.debit = checked_add(s.debit, row.debit_amount());
        s.credit = checked_add(s.credit, row.credit_amount());

        if (seen[row.voucher_date].insert(row.voucher_id).second) {
            s.voucher_count++;
            s.voucher_types[to_string(row.voucher_type)]++;
        }
    }

    std::vector<DaySummary> result;
    for (const auto& kv : days) result.push_back(kv.second);
    return result;
}

CustomerStatement customer_statement(const Account& account, const std::vector<EntryRow>& rows,
                                     const date& from, const date& to) {
    if (from > to) {
        throw validation_error("InvalidDateRange", "Range start " + format_date(from) + " is after its end " + format_date(to) + ".");
    }

    CustomerStatement st;
    st.account_id = account.id;
    st.account_code = account.code;
    st.account_name = account.name;
    st.from = from;
    st.to = to;

    std::vector<EntryRow> own;
    for (const auto& row : rows) {
        if (row.account_id == account.id && counts_cumulatively(row)) own.push_back(row);
    }
    sort_for_reporting(own);

    money_micro running = 0;
    for (const auto& row : own) {
        if (row.voucher_date > to) break;
        money_micro movement = row.debit_amount() - row.credit_amount();
        if (row.voucher_date < from) {
            st.opening_balance = checked_add(st.opening_balance, movement);
            running = checked_add(running, movement);
            continue;
        }

        running = checked_add(running, movement);
        st.total_debit = checked_add(st.total_debit, row.debit_amount());
        st.total_credit = checked_add(st.total_credit, row.credit_amount());

        CustomerStatementLine line;
        line.day = row.voucher_date;
        line.voucher_id = row.voucher_id;
        line.voucher_type = row.voucher_type;
        line.narration = row.narration.empty() ? row.voucher_narration : row.narration;
        line.debit = row.debit_amount();
        line.credit = row.credit_amount();
        line.running_balance = running;
        st.lines.push_back(line);
    }

    st.closing_balance = running;
    return st;
}

} // namespace ppl
