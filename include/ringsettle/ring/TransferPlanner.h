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

#ifndef RINGSETTLE_RING_TRANSFERPLANNER_H_INCLUDED
#define RINGSETTLE_RING_TRANSFERPLANNER_H_INCLUDED

#include <ringsettle/basics/Journal.h>
#include <ringsettle/protocol/Order.h>
#include <ringsettle/protocol/TransferItem.h>

#include <vector>

namespace ringsettle {

/** Turns fitted orders into token transfers.

    For each order, in ring order, the planner emits:

    @li the principal: fillAmountS of tokenS to the previous order's owner,
    @li the fee, if any: fillAmountFee of feeToken to the fee holder,
    @li the spread, if any: splitS of tokenS to the fee holder.

    Orders with nothing to sell produce no transfers.
*/
class TransferPlanner
{
private:
    AccountID feeHolder_;
    Journal j_;

public:
    TransferPlanner(AccountID const& feeHolder, Journal j);

    /** Plan the transfers that settle a ring.

        @param walletSplitPercentage Share of fees meant for referring
               wallets. Must be within [0, 100]; it does not yet change
               the routing.

        @return An empty list if the ring is not valid.

        @throws std::invalid_argument if walletSplitPercentage is out of
                range. Checked before anything else.
        @throws InvariantViolation if a fitted order is inconsistent.
    */
    std::vector<TransferItem>
    getRingTransferItems(
        std::vector<Order> const& orders,
        bool valid,
        int walletSplitPercentage) const;

private:
    void
    logOrder(std::size_t index, Order const& order) const;

    static void
    checkInvariants(std::size_t index, Order const& order);
};

}  // namespace ringsettle

#endif
