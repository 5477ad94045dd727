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
#include <ringsettle/protocol/TokenAmount.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace ringsettle {

std::optional<TokenAmount>
parseTokenAmount(std::string const& s)
{
    if (s.empty() || s.size() > 78)
        return std::nullopt;

    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        return std::nullopt;

    // 78 digits can still exceed 2^256 - 1
    boost::multiprecision::cpp_int const wide(s.c_str());
    if (wide > boost::multiprecision::cpp_int(
                   std::numeric_limits<TokenAmount>::max()))
        return std::nullopt;

    return static_cast<TokenAmount>(wide);
}

std::string
to_string(TokenAmount const& amount)
{
    return amount.str();
}

TokenAmount
scaleAmount(
    TokenAmount const& value,
    TokenAmount const& mul,
    TokenAmount const& div)
{
    auto const result = mulDiv(value, mul, div);
    if (!result)
        Throw<std::overflow_error>("scaleAmount: result out of range");
    return *result;
}

}  // namespace ringsettle
