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

#ifndef RINGSETTLE_PROTOCOL_ORDER_H_INCLUDED
#define RINGSETTLE_PROTOCOL_ORDER_H_INCLUDED

#include <ringsettle/basics/base_uint.h>
#include <ringsettle/protocol/AccountID.h>
#include <ringsettle/protocol/TokenAmount.h>

#include <ostream>

namespace ringsettle {

/** One trade order taking part in a ring.

    The order offers `amountS` of `tokenS` in exchange for `amountB` of
    `tokenB`, paying at most `feeAmount` of `feeToken`. The fill fields
    start out set by the spendable-balance scaler and are narrowed by the
    fitter.
*/
struct Order
{
    uint256 hash;

    AccountID owner;
    AccountID tokenS;
    AccountID tokenB;
    AccountID feeToken;

    // Referring wallet. Carried, but unused while wallet splitting is off.
    AccountID walletAddr;

    TokenAmount amountS = 0;
    TokenAmount amountB = 0;
    TokenAmount feeAmount = 0;

    TokenAmount fillAmountS = 0;
    TokenAmount fillAmountB = 0;
    TokenAmount fillAmountFee = 0;
    TokenAmount splitS = 0;

    bool valid = true;
};

std::ostream&
operator<<(std::ostream& os, Order const& order);

}  // namespace ringsettle

#endif
