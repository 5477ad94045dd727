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

#ifndef RINGSETTLE_CORE_RINGFILE_H_INCLUDED
#define RINGSETTLE_CORE_RINGFILE_H_INCLUDED

#include <ringsettle/basics/BasicConfig.h>
#include <ringsettle/protocol/AccountID.h>
#include <ringsettle/protocol/Order.h>
#include <ringsettle/protocol/TokenAmount.h>
#include <ringsettle/ring/BalanceSheet.h>

#include <boost/filesystem.hpp>

#include <string>
#include <vector>

namespace ringsettle {

/** A ring to settle, together with the balances it settles against.

    @code
    [ring]
    owner=0x...
    fee_recipient=0x...

    [order.0]
    hash=0x...
    owner=0x...
    token_s=0x...
    token_b=0x...
    amount_s=100
    amount_b=100
    fee_token=0x...
    fee_amount=5

    [balances]
    <owner> <token> <amount>

    [tokens]
    <token>
    @endcode

    Order sections are numbered from 0 without gaps.
*/
class RingFile : public BasicConfig
{
public:
    struct Balance
    {
        AccountID owner;
        AccountID token;
        TokenAmount amount;
    };

    AccountID owner;
    AccountID feeRecipient;
    std::vector<Order> orders;
    std::vector<Balance> balances;
    std::vector<AccountID> tokens;

public:
    /** @throws std::runtime_error on a missing or malformed value. */
    void
    setup(boost::filesystem::path const& ringFile);

    /** @throws std::runtime_error on a missing or malformed value. */
    void
    loadFromString(std::string const& fileContents);

    /** Load the balances and registered tokens into a sheet. */
    void
    populate(BalanceSheet& sheet) const;
};

}  // namespace ringsettle

#endif
