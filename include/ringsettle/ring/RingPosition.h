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


#ifndef RINGSETTLE_RING_RINGPOSITION_H_INCLUDED
#define RINGSETTLE_RING_RINGPOSITION_H_INCLUDED

#include <ringsettle/basics/contract.h>

#include <cstddef>
#include <stdexcept>

namespace ringsettle {

/** Wrap-around neighbours of position `i` in a ring of `size` orders.

    Order `i` buys what order `nextIndex(i)` sells, and receives its
    principal from order `prevIndex(i)`.

    @throws std::out_of_range if `i` is not a position of the ring,
            which includes every position of an empty ring.
*/
/** @{ */
inline std::size_t
prevIndex(std::size_t i, std::size_t size)
{
    if (i >= size)
        Throw<std::out_of_range>("ring position out of range");
    return i == 0 ? size - 1 : i - 1;
}

inline std::size_t
nextIndex(std::size_t i, std::size_t size)
{
    if (i >= size)
        Throw<std::out_of_range>("ring position out of range");
    return i + 1 == size ? 0 : i + 1;
}
/** @} */

}  // namespace ringsettle

#endif
