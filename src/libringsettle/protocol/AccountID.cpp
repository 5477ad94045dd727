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

#include <ringsettle/basics/StringUtilities.h>
#include <ringsettle/protocol/AccountID.h>

namespace ringsettle {

std::optional<AccountID>
parseAccountID(std::string_view s)
{
    auto const hex = stripHexPrefix(std::string(s));

    // The lone "0" shorthand base_uint accepts is not an address
    if (hex.size() != AccountID::size() * 2)
        return std::nullopt;

    AccountID result;
    if (!result.parseHex(hex))
        return std::nullopt;
    return result;
}

std::string
toAddress(AccountID const& account)
{
    return "0x" + to_string(account);
}

}  // namespace ringsettle
