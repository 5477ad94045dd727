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

#ifndef RINGSETTLE_BASICS_MULDIV_H_INCLUDED
#define RINGSETTLE_BASICS_MULDIV_H_INCLUDED

#include <boost/multiprecision/cpp_int.hpp>

#include <optional>

namespace ringsettle {

/** Signed 256-bit integer that throws on overflow. */
using int256 = boost::multiprecision::checked_int256_t;

/** Return value*mul/div accurately.
    Computes the result of the multiplication and division in
    a single step, avoiding overflow and retaining precision.
    The quotient is truncated toward zero.
    Throws:
        std::domain_error if div is zero
    Returns:
        `std::nullopt` if the result does not fit in an int256.
*/
std::optional<int256>
mulDiv(int256 const& value, int256 const& mul, int256 const& div);

}  // namespace ringsettle

#endif
