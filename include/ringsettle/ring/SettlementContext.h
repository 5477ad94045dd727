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

#ifndef RINGSETTLE_RING_SETTLEMENTCONTEXT_H_INCLUDED
#define RINGSETTLE_RING_SETTLEMENTCONTEXT_H_INCLUDED

#include <ringsettle/protocol/AccountID.h>
#include <ringsettle/protocol/Order.h>

#include <vector>

namespace ringsettle {

/** Caps an order's fill amounts by what its owner can actually spend.

    Implementations set fillAmountS, fillAmountB and fillAmountFee to the
    largest values the owner's balance allows, reset splitS to zero, and
    may clear `valid`. They may also throw.
*/
class SpendableScaler
{
public:
    virtual ~SpendableScaler() = default;

    virtual void
    scaleBySpendableAmount(Order& order) = 0;
};

/** Answers whether tokens are known to the exchange. */
class TokenRegistry
{
public:
    virtual ~TokenRegistry() = default;

    virtual bool
    areAllTokensRegistered(std::vector<AccountID> const& tokens) const = 0;
};

/** Collaborators a ring settles against. */
struct SettlementContext
{
    SpendableScaler& scaler;
    TokenRegistry& registry;

    // Receives fees and captured spread
    AccountID feeHolder;
};

}  // namespace ringsettle

#endif
