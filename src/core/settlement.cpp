/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settlement.cpp
 * ============================================================================
 */

#include "settlement.hpp"

#include <algorithm>

namespace ppl {

namespace {

InterestPeriod period(const Pledge& pledge, int index, money_micro amount) {
    InterestPeriod p;
    p.index = index;
    p.from = add_months(pledge.pledge_date, index);
    p.to = add_months(pledge.pledge_date, index + 1) - boost::gregorian::days(1);
    p.days = static_cast<int>((p.to - p.from).days()) + 1;
    p.rate = pledge.monthly_rate;
    p.amount = amount;
    p.mandatory = index == 0;
    return p;
}

} // namespace

money_micro accrued_interest(const Pledge& pledge, const date& as_of) {
    return completed_months(pledge.pledge_date, as_of) * apply_rate(pledge.principal, pledge.monthly_rate);
}

money_micro total_due(const Pledge& pledge, const date& as_of) {
    return pledge.principal + pledge.first_month_interest + accrued_interest(pledge, as_of);
}

money_micro total_paid(const Pledge& pledge, const std::vector<Payment>& payments) {
    money_micro paid = pledge.first_month_interest;
    for (const auto& p : payments) {
        if (p.kind == PaymentKind::Regular) paid += p.settled_value();
    }
    return paid;
}

SettlementQuote settlement_quote(const Pledge& pledge, const std::vector<Payment>& payments, const date& as_of) {
    SettlementQuote q;
    q.pledge_id = pledge.id;
    q.as_of = as_of;
    q.principal = pledge.principal;
    q.completed_months = completed_months(pledge.pledge_date, as_of);

    q.breakdown.push_back(period(pledge, 0, pledge.first_month_interest));
    q.total_interest = pledge.first_month_interest;

    money_micro monthly = apply_rate(pledge.principal, pledge.monthly_rate);
    for (int i = 1; i <= q.completed_months; i++) {
        q.breakdown.push_back(period(pledge, i, monthly));
        q.total_interest += monthly;
    }

    q.paid_interest = pledge.first_month_interest;
    for (const auto& p : payments) {
        if (p.kind != PaymentKind::Regular) continue;
        q.paid_interest += p.interest;
        q.paid_principal += p.principal;
        q.paid_discount += p.discount;
    }

    q.remaining_interest = q.total_interest - q.paid_interest;
    q.remaining_principal = pledge.principal - q.paid_principal - q.paid_discount;
    q.final_amount = std::max<money_micro>(0, q.remaining_principal + q.remaining_interest);
    return q;
}

PledgeStatus derive_status(const Pledge& pledge, const std::vector<Payment>& payments, const date& as_of) {
    if (settled(total_due(pledge, as_of), total_paid(pledge, payments))) {
        return PledgeStatus::Redeemed;
    }
    for (const auto& p : payments) {
        if (p.kind == PaymentKind::Regular) return PledgeStatus::PartialPaid;
    }
    return PledgeStatus::Active;
}

date status_date(const Pledge& pledge, const std::vector<Payment>& payments) {
    date latest = pledge.pledge_date;
    for (const auto& p : payments) {
        if (p.kind == PaymentKind::Regular && p.payment_date > latest) latest = p.payment_date;
    }
    return latest;
}

void recompute_payment_balances(const Pledge& pledge, std::vector<Payment>& payments) {
    std::vector<Payment*> ordered;
    for (auto& p : payments) ordered.push_back(&p);
    std::sort(ordered.begin(), ordered.end(), [](const Payment* a, const Payment* b) {
        if (a->payment_date != b->payment_date) return a->payment_date < b->payment_date;
        return a->id < b->id;
    });

    money_micro paid = pledge.first_month_interest;
    for (Payment* p : ordered) {
        if (p->kind == PaymentKind::Regular) paid += p->settled_value();
        p->balance_amount = std::max<money_micro>(0, total_due(pledge, p->payment_date) - paid);
    }
}

} // namespace ppl
