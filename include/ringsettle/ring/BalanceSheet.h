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

#ifndef RINGSETTLE_RING_BALANCESHEET_H_INCLUDED
#define RINGSETTLE_RING_BALANCESHEET_H_INCLUDED

#include <ringsettle/protocol/AccountID.h>
#include <ringsettle/protocol/TokenAmount.h>
#include <ringsettle/ring/SettlementContext.h>

#include <map>
#include <set>
#include <utility>
#include <vector>

namespace ringsettle {

/** In-memory balances and token registry.

    Stands in for the order subsystem and the exchange's token
    registry when a ring is settled off-chain.
*/
class BalanceSheet : public SpendableScaler, public TokenRegistry
{
private:
    std::map<std::pair<AccountID, AccountID>, TokenAmount> balances_;
    std::set<AccountID> tokens_;

public:
    BalanceSheet() = default;

    /** Record what `owner` can spend of `token`.

        @throws std::invalid_argument if amount is negative.
    */
    void
    setBalance(
        AccountID const& owner,
        AccountID const& token,
        TokenAmount const& amount);

    /** Returns the recorded balance, or zero. */
    TokenAmount
    spendable(AccountID const& owner, AccountID const& token) const;

    void
    registerToken(AccountID const& token);

    void
    scaleBySpendableAmount(Order& order) override;

    bool
    areAllTokensRegistered(
        std::vector<AccountID> const& tokens) const override;
};

}  // namespace ringsettle

#endif
