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

#ifndef RINGSETTLE_PROTOCOL_ACCOUNTID_H_INCLUDED
#define RINGSETTLE_PROTOCOL_ACCOUNTID_H_INCLUDED

#include <ringsettle/basics/base_uint.h>

#include <optional>
#include <string>
#include <string_view>

namespace ringsettle {

namespace detail {

class AccountIDTag
{
public:
    explicit AccountIDTag() = default;
};

}  // namespace detail

/** A 160-bit unsigned that uniquely identifies an account or token. */
using AccountID = base_uint<160, detail::AccountIDTag>;

/** Parse an AccountID from 40 hex digits, with or without a 0x prefix. */
std::optional<AccountID>
parseAccountID(std::string_view s);

/** Returns the address as 0x-prefixed lowercase hex. */
std::string
toAddress(AccountID const& account);

}  // namespace ringsettle

#endif
