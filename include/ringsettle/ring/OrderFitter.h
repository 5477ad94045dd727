//------------------------------------------------------------------------------
/*
    This file is part of ringsettle
    Copyright (c) 2026 the ringsettle authors

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#ifndef RINGSETTLE_RING_ORDERFITTER_H_INCLUDED
#define RINGSETTLE_RING_ORDERFITTER_H_INCLUDED

#include <ringsettle/basics/Journal.h>
#include <ringsettle/protocol/Order.h>
#include <ringsettle/ring/SettlementContext.h>

#include <cstddef>
#include <vector>

namespace ringsettle {

/** Computes one consistent set of fill amounts for a ring.

    Order i buys what order i+1 sells, so along every edge the amount
    order i receives must equal what its successor gives up. The fitter
    first caps every order by its owner's spendable balance, then walks
    the ring backwards shrinking each predecessor until its buy amount
    no longer exceeds what the order after it can sell. Whatever a
    seller still has left over past that point is recorded as splitS,
    the spread captured by the ring.

    All arithmetic truncates toward zero, so adjustments only ever
    shrink amounts.
*/
class OrderFitter
{
private:
    SpendableScaler& scaler_;
    Journal j_;
    double rate_ = 0.0;

public:
    OrderFitter(SpendableScaler& scaler, Journal j);

    /** Fit the ring in place.

        @return `false` if spendable scaling left some order invalid.
                The orders are then left as scaled and not resized.

        @throws std::invalid_argument if an order has a non-positive
                amountS or amountB. Nothing is modified in that case.
        @throws UnsettleableRing if adjacent fills cannot be balanced.
        @throws std::overflow_error if an amount leaves the 256-bit range.
    */
    bool
    calculateFillAmountAndFee(std::vector<Order>& orders);

    /** Product of amountS/amountB over the ring, from the last fit.

        A value above one means the ring as priced leaves a spread.
        Informational only.
    */
    double
    rate() const
    {
        return rate_;
    }

private:
    static double
    priceRatio(Order const& order);

    // Shrinks the predecessor of order i so that it buys no more than
    // order i sells. Returns i if it had to, else smallest.
    std::size_t
    resize(std::vector<Order>& orders, std::size_t i, std::size_t smallest)
        const;
};

}  // namespace ringsettle

#endif
