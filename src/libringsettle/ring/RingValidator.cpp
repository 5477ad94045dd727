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
#include <ringsettle/ring/RingValidator.h>

namespace ringsettle {

RingValidator::RingValidator(Journal j) : j_(j)
{
}

bool
RingValidator::checkOrdersValid(std::vector<Order> const& orders) const
{
    bool valid = true;
    for (std::size_t i = 0; i < orders.size(); ++i)
    {
        if (!orders[i].valid)
        {
            JLOG(j_.debug()) << "position " << i << " holds an invalid "
                             << orders[i];
            valid = false;
        }
    }
    return valid;
}

bool
RingValidator::checkTokensRegistered(
    std::vector<Order> const& orders,
    TokenRegistry const& registry) const
{
    std::vector<AccountID> tokens;
    tokens.reserve(orders.size());
    for (auto const& order : orders)
        tokens.push_back(order.tokenS);

    bool const registered = registry.areAllTokensRegistered(tokens);
    if (!registered)
        JLOG(j_.debug()) << "ring sells an unregistered token";
    return registered;
}

}  // namespace ringsettle
