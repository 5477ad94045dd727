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

#ifndef RINGSETTLE_RING_RINGVALIDATOR_H_INCLUDED
#define RINGSETTLE_RING_RINGVALIDATOR_H_INCLUDED

#include <ringsettle/basics/Journal.h>
#include <ringsettle/protocol/Order.h>
#include <ringsettle/ring/SettlementContext.h>

#include <vector>

namespace ringsettle {

/** Decides whether a ring may be settled at all.

    Each check returns its own verdict. The caller folds the verdicts
    into the ring's validity flag, which only ever goes from true to
    false.
*/
class RingValidator
{
private:
    Journal j_;

public:
    explicit RingValidator(Journal j);

    /** Returns `true` if every order is flagged valid.
        Every order is inspected so that each bad one gets logged.
    */
    bool
    checkOrdersValid(std::vector<Order> const& orders) const;

    /** Returns `true` if every sold token is registered. */
    bool
    checkTokensRegistered(
        std::vector<Order> const& orders,
        TokenRegistry const& registry) const;
};

}  // namespace ringsettle

#endif
