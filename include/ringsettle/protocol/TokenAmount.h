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

#ifndef RINGSETTLE_PROTOCOL_TOKENAMOUNT_H_INCLUDED
#define RINGSETTLE_PROTOCOL_TOKENAMOUNT_H_INCLUDED

#include <ringsettle/basics/mulDiv.h>

#include <optional>
#include <string>

namespace ringsettle {

/** A quantity of some token, in the token's smallest unit.

    Arithmetic that leaves the 256-bit range throws std::overflow_error.
*/
using TokenAmount = int256;

/** Parse a non-negative decimal amount.

    @return The amount, or `std::nullopt` if the text is not a plain
            decimal integer or does not fit.
*/
std::optional<TokenAmount>
parseTokenAmount(std::string const& s);

std::string
to_string(TokenAmount const& amount);

/** Return value*mul/div, truncated toward zero.

    Unlike mulDiv, a result out of range is an error.

    @throws std::overflow_error if the result does not fit.
*/
TokenAmount
scaleAmount(
    TokenAmount const& value,
    TokenAmount const& mul,
    TokenAmount const& div);

}  // namespace ringsettle

#endif
