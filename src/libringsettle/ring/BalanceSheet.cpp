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

#include <ringsettle/basics/contract.h>
#include <ringsettle/ring/BalanceSheet.h>

#include <algorithm>
#include <stdexcept>

namespace ringsettle {

void
BalanceSheet::setBalance(
    AccountID const& owner,
    AccountID const& token,
    TokenAmount const& amount)
{
    if (amount < 0)
        Throw<std::invalid_argument>("balance must not be negative");
    balances_[{owner, token}] = amount;
}

TokenAmount
BalanceSheet::spendable(AccountID const& owner, AccountID const& token) const
{
    auto const iter = balances_.find({owner, token});
    if (iter == balances_.end())
        return 0;
    return iter->second;
}

void
BalanceSheet::registerToken(AccountID const& token)
{
    tokens_.insert(token);
}

void
BalanceSheet::scaleBySpendableAmount(Order& order)
{
    if (order.amountS <= 0)
        Throw<std::invalid_argument>("order must sell a positive amount");

    order.fillAmountS =
        std::min(order.amountS, spendable(order.owner, order.tokenS));
    order.fillAmountB =
        scaleAmount(order.fillAmountS, order.amountB, order.amountS);
    order.fillAmountFee =
        scaleAmount(order.feeAmount, order.fillAmountS, order.amountS);
    order.splitS = 0;
}

bool
BalanceSheet::areAllTokensRegistered(
    std::vector<AccountID> const& tokens) const
{
    return std::all_of(tokens.begin(), tokens.end(), [this](auto const& t) {
        return tokens_.count(t) != 0;
    });
}

}  // namespace ringsettle
