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

#ifndef RINGSETTLE_RING_RINGIDENTITY_H_INCLUDED
#define RINGSETTLE_RING_RINGIDENTITY_H_INCLUDED

#include <ringsettle/basics/base_uint.h>
#include <ringsettle/protocol/Order.h>

#include <vector>

namespace ringsettle {

/** Returns the identifier of a ring.

    The identifier is the SHA3-256 digest of the order hashes, taken
    in ring order. Rotating or reordering the ring changes it.

    @note This is FIPS 202 SHA3-256, not the original Keccak-256 that
          Ethereum's `soliditySHA3` computes. The two pad differently,
          so these identifiers never equal ring ids computed on chain.
*/
uint256
ringHash(std::vector<Order> const& orders);

}  // namespace ringsettle

#endif
