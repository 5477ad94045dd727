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

#ifndef RINGSETTLE_RING_RING_H_INCLUDED
#define RINGSETTLE_RING_RING_H_INCLUDED

#include <ringsettle/basics/Journal.h>
#include <ringsettle/basics/base_uint.h>
#include <ringsettle/protocol/Order.h>
#include <ringsettle/protocol/TransferItem.h>
#include <ringsettle/ring/OrderFitter.h>
#include <ringsettle/ring/RingValidator.h>
#include <ringsettle/ring/SettlementContext.h>
#include <ringsettle/ring/TransferPlanner.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace ringsettle {

/** A cycle of orders to be settled together.

    A Ring is built for one settlement attempt. The usual sequence is
    validate, fit, then plan transfers, which settle() runs in one call.
    Once the ring is found invalid it stays invalid.
*/
class Ring
{
private:
    SettlementContext& ctx_;
    std::vector<Order> orders_;
    AccountID owner_;
    AccountID feeRecipient_;
    Journal j_;

    RingValidator validator_;
    OrderFitter fitter_;
    TransferPlanner planner_;

    std::optional<uint256> hash_;
    bool valid_ = true;

public:
    Ring(
        SettlementContext& ctx,
        std::vector<Order> orders,
        AccountID const& owner,
        AccountID const& feeRecipient,
        Journal j);

    Ring(Ring const&) = delete;
    Ring&
    operator=(Ring const&) = delete;

    /** Recompute and cache the ring identifier. */
    void
    updateHash();

    /** Returns the ring identifier, computing it if needed. */
    uint256 const&
    hash();

    /** Clear validity unless every order is flagged valid. */
    void
    checkOrdersValid();

    /** Clear validity unless every sold token is registered. */
    void
    checkTokensRegistered();

    /** Scale and resize every order.

        Leaves the ring invalid if scaling invalidates an order. If this
        throws, the ring is marked invalid before the exception leaves.

        @throws UnsettleableRing
    */
    void
    calculateFillAmountAndFee();

    /** Transfers that settle the ring; empty if it is invalid. */
    std::vector<TransferItem>
    getRingTransferItems(int walletSplitPercentage) const;

    /** Validate, fit, and plan in one call. */
    std::vector<TransferItem>
    settle(int walletSplitPercentage);

    std::vector<Order> const&
    orders() const
    {
        return orders_;
    }

    std::size_t
    size() const
    {
        return orders_.size();
    }

    AccountID const&
    owner() const
    {
        return owner_;
    }

    AccountID const&
    feeRecipient() const
    {
        return feeRecipient_;
    }

    bool
    valid() const
    {
        return valid_;
    }

    /** Product of the orders' price ratios; zero before fitting. */
    double
    rate() const
    {
        return fitter_.rate();
    }
};

}  // namespace ringsettle

#endif
