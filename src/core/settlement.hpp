/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settlement.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Pledge interest and settlement arithmetic.
 *
 * Interest is charged in advance, one month at a time. The first month is
 * collected at disbursal and is never refunded. Each time another full
 * calendar month completes (counted from the pledge date) the next month's
 * interest, principal x monthly rate, falls due. Part months add nothing.
 *
 *   pledged 15 Jan, quoted 14 Feb  -> first month only
 *   pledged 15 Jan, quoted 15 Feb  -> first month + 1
 * ============================================================================
 */

#ifndef PPL_SETTLEMENT_HPP
#define PPL_SETTLEMENT_HPP

#include <vector>

#include "dates.hpp"
#include "model.hpp"

namespace ppl {

    struct InterestPeriod {
        int index = 0;          // 0 is the mandatory first month
        date from;
        date to;
        int days = 0;
        rate_ppm rate = 0;
        money_micro amount = 0;
        bool mandatory = false;
    };

    struct SettlementQuote {
        int64_t pledge_id = 0;
        date as_of;
        int completed_months = 0;
        money_micro principal = 0;
        money_micro total_interest = 0;
        money_micro paid_interest = 0;
        money_micro paid_principal = 0;
        money_micro paid_discount = 0;
        money_micro remaining_interest = 0;
        money_micro remaining_principal = 0;
        money_micro final_amount = 0;       // pay this to close the pledge
        std::vector<InterestPeriod> breakdown;
    };

    /**
     * @brief Interest for the completed months beyond the first, as of a date.
     */
    money_micro accrued_interest(const Pledge& pledge, const date& as_of);

    /**
     * @brief principal + first-month interest + accrued interest.
     */
    money_micro total_due(const Pledge& pledge, const date& as_of);

    /**
     * @brief First-month interest (collected at disbursal) plus the settled
     * value of every regular payment.
     */
    money_micro total_paid(const Pledge& pledge, const std::vector<Payment>& payments);

    /**
     * settlement_quote
     * Same pledge, payments and date always give the same quote. The
     * breakdown lines add up to total_interest exactly.
     */
    SettlementQuote settlement_quote(const Pledge& pledge, const std::vector<Payment>& payments, const date& as_of);

    /**
     * derive_status
     * redeemed once what is due is settled within tolerance, partial_paid
     * once any regular payment exists, otherwise active.
     */
    PledgeStatus derive_status(const Pledge& pledge, const std::vector<Payment>& payments, const date& as_of);

    /**
     * @brief The date status is judged on: the latest regular payment, or the
     * pledge date when there is none.
     */
    date status_date(const Pledge& pledge, const std::vector<Payment>& payments);

    /**
     * @brief Rewrites balance_amount on every payment, in (date, id) order,
     * as what remained due right after that payment.
     */
    void recompute_payment_balances(const Pledge& pledge, std::vector<Payment>& payments);

} // namespace ppl

#endif // PPL_SETTLEMENT_HPP
