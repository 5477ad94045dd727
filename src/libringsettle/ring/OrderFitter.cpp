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

#include <ringsettle/basics/Log.h>
#include <ringsettle/basics/contract.h>
#include <ringsettle/ring/OrderFitter.h>
#include <ringsettle/ring/RingPosition.h>
#include <ringsettle/ring/SettlementErrors.h>

#include <stdexcept>

namespace ringsettle {

OrderFitter::OrderFitter(SpendableScaler& scaler, Journal j)
    : scaler_(scaler), j_(j)
{
}

double
OrderFitter::priceRatio(Order const& order)
{
    return order.amountS.convert_to<double>() /
        order.amountB.convert_to<double>();
}

bool
OrderFitter::calculateFillAmountAndFee(std::vector<Order>& orders)
{
    for (std::size_t i = 0; i < orders.size(); ++i)
    {
        if (orders[i].amountS <= 0 || orders[i].amountB <= 0)
            Throw<std::invalid_argument>(
                "order " + std::to_string(i) +
                " must have positive amountS and amountB");
    }

    // Every order is scaled before any of them is resized
    for (auto& order : orders)
        scaler_.scaleBySpendableAmount(order);

    for (std::size_t i = 0; i < orders.size(); ++i)
    {
        if (!orders[i].valid)
        {
            JLOG(j_.debug())
                << "order " << i << " invalid after spendable scaling";
            return false;
        }
    }

    auto const size = orders.size();
    if (size == 0)
        return true;

    rate_ = 1.0;
    for (auto const& order : orders)
        rate_ *= priceRatio(order);
    JLOG(j_.debug()) << "ring rate: " << rate_;

    std::size_t smallest = 0;
    for (std::size_t i = size; i-- > 0;)
        smallest = resize(orders, i, smallest);

    // Shrinking the predecessor of `smallest` may have left the orders
    // after it buying more than their successors now sell.
    for (std::size_t i = size; i-- > smallest;)
        resize(orders, i, smallest);

    for (std::size_t i = 0; i < size; ++i)
    {
        auto const n = nextIndex(i, size);
        auto const& cur = orders[i];
        auto& next = orders[n];

        if (next.fillAmountS < cur.fillAmountB)
        {
            JLOG(j_.warn()) << "order " << n << " sells "
                            << next.fillAmountS << " but order " << i
                            << " buys " << cur.fillAmountB;
            Throw<UnsettleableRing>(
                "unsettleable ring: order " + std::to_string(i) +
                " buys more than its successor sells");
        }

        next.splitS = next.fillAmountS - cur.fillAmountB;
        next.fillAmountS = cur.fillAmountB;
    }

    return true;
}

std::size_t
OrderFitter::resize(
    std::vector<Order>& orders,
    std::size_t i,
    std::size_t smallest) const
{
    auto const p = prevIndex(i, orders.size());
    auto const& order = orders[i];
    auto& prev = orders[p];

    if (prev.fillAmountB <= order.fillAmountS)
        return smallest;

    prev.fillAmountB = order.fillAmountS;
    prev.fillAmountS =
        scaleAmount(prev.fillAmountB, prev.amountS, prev.amountB);
    prev.fillAmountFee =
        scaleAmount(prev.feeAmount, prev.fillAmountS, prev.amountS);

    JLOG(j_.trace()) << "order " << p << " resized to sell "
                     << prev.fillAmountS << " for " << prev.fillAmountB;
    return i;
}

}  // namespace ringsettle
