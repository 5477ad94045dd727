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
#include <ringsettle/basics/scope.h>
#include <ringsettle/ring/Ring.h>
#include <ringsettle/ring/RingIdentity.h>

#include <utility>

namespace ringsettle {

Ring::Ring(
    SettlementContext& ctx,
    std::vector<Order> orders,
    AccountID const& owner,
    AccountID const& feeRecipient,
    Journal j)
    : ctx_(ctx)
    , orders_(std::move(orders))
    , owner_(owner)
    , feeRecipient_(feeRecipient)
    , j_(j)
    , validator_(j)
    , fitter_(ctx.scaler, j)
    , planner_(ctx.feeHolder, j)
{
}

void
Ring::updateHash()
{
    hash_ = ringHash(orders_);
}

uint256 const&
Ring::hash()
{
    if (!hash_)
        updateHash();
    return *hash_;
}

void
Ring::checkOrdersValid()
{
    bool const ordersValid = validator_.checkOrdersValid(orders_);
    valid_ = valid_ && ordersValid;
}

void
Ring::checkTokensRegistered()
{
    bool const registered =
        validator_.checkTokensRegistered(orders_, ctx_.registry);
    valid_ = valid_ && registered;
}

void
Ring::calculateFillAmountAndFee()
{
    scope_fail invalidate{[this]() noexcept { valid_ = false; }};

    if (!fitter_.calculateFillAmountAndFee(orders_))
        valid_ = false;
}

std::vector<TransferItem>
Ring::getRingTransferItems(int walletSplitPercentage) const
{
    return planner_.getRingTransferItems(
        orders_, valid_, walletSplitPercentage);
}

std::vector<TransferItem>
Ring::settle(int walletSplitPercentage)
{
    updateHash();
    JLOG(j_.debug()) << "settling ring " << *hash_ << " of " << size()
                     << " orders";

    checkOrdersValid();
    checkTokensRegistered();

    if (valid_)
        calculateFillAmountAndFee();

    return getRingTransferItems(walletSplitPercentage);
}

}  // namespace ringsettle
