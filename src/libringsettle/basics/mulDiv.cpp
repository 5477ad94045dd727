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
#include <ringsettle/basics/mulDiv.h>

#include <limits>
#include <stdexcept>

namespace ringsettle {

std::optional<int256>
mulDiv(int256 const& value, int256 const& mul, int256 const& div)
{
    using namespace boost::multiprecision;

    if (div == 0)
        Throw<std::domain_error>("mulDiv: division by zero");

    cpp_int result = cpp_int(value) * cpp_int(mul);

    // cpp_int division truncates toward zero
    result /= cpp_int(div);

    if (result > cpp_int(std::numeric_limits<int256>::max()) ||
        result < cpp_int(std::numeric_limits<int256>::min()))
        return std::nullopt;

    return static_cast<int256>(result);
}

}  // namespace ringsettle
