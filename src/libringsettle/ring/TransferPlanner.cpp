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
#include <ringsettle/ring/RingPosition.h>
#include <ringsettle/ring/SettlementErrors.h>
#include <ringsettle/ring/TransferPlanner.h>

#include <stdexcept>
#include <string>

namespace ringsettle {

TransferPlanner::TransferPlanner(AccountID const& feeHolder, Journal j)
    : feeHolder_(feeHolder), j_(j)
{
}

std::vector<TransferItem>
TransferPlanner::getRingTransferItems(
    std::vector<Order> const& orders,
    bool valid,
    int walletSplitPercentage) const
{
    if (walletSplitPercentage < 0 || walletSplitPercentage > 100)
        Throw<std::invalid_argument>(
            "invalid walletSplitPercentage: " +
            std::to_string(walletSplitPercentage));

    std::vector<TransferItem> items;

    if (!valid)
    {
        JLOG(j_.warn()) << "ring cannot be settled";
        return items;
    }

    auto const size = orders.size();
    for (std::size_t i = 0; i < size; ++i)
    {
        auto const& order = orders[i];
        auto const& prev = orders[prevIndex(i, size)];

        logOrder(i, order);
        checkInvariants(i, order);

        if (order.fillAmountS == 0)
            continue;

        items.push_back({order.tokenS, order.owner, prev.owner,
                         order.fillAmountS});

        if (order.fillAmountFee > 0)
            items.push_back({order.feeToken, order.owner, feeHolder_,
                             order.fillAmountFee});

        if (order.splitS > 0)
            items.push_back({order.tokenS, order.owner, feeHolder_,
                             order.splitS});
    }

    return items;
}

void
TransferPlanner::logOrder(std::size_t index, Order const& order) const
{
    auto stream = j_.debug();
    if (!stream)
        return;

    stream << "order " << index << ": amountS " << order.amountS
           << " amountB " << order.amountB << " expected rate "
           << order.amountS.convert_to<double>() /
            order.amountB.convert_to<double>();
    stream << "order " << index << ": fillAmountS " << order.fillAmountS
           << " fillAmountB " << order.fillAmountB << " splitS "
           << order.splitS << " fee " << order.fillAmountFee;
    if (order.fillAmountB != 0)
        stream << "order " << index << ": actual rate "
               << TokenAmount(order.fillAmountS + order.splitS)
                    .convert_to<double>() /
                order.fillAmountB.convert_to<double>();
}

void
TransferPlanner::checkInvariants(std::size_t index, Order const& order)
{
    auto fail = [index](char const* what) {
        Throw<InvariantViolation>(
            "order " + std::to_string(index) + ": " + what);
    };

    if (order.fillAmountS < 0)
        fail("fillAmountS must not be negative");
    if (order.splitS < 0)
        fail("splitS must not be negative");
    if (order.fillAmountFee < 0)
        fail("fillAmountFee must not be negative");
    if (order.fillAmountS + order.splitS > order.amountS)
        fail("fillAmountS + splitS must not exceed amountS");
    if (order.fillAmountS > order.amountS)
        fail("fillAmountS must not exceed amountS");
    if (order.fillAmountFee > order.feeAmount)
        fail("fillAmountFee must not exceed feeAmount");
}

}  // namespace ringsettle
