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

#include <ringsettle/protocol/digest.h>
#include <ringsettle/ring/RingIdentity.h>

#include <tests/ring/RingFixtures.h>

#include <doctest/doctest.h>

#include <vector>

using namespace ringsettle;
using namespace ringsettle::test;

TEST_CASE("ringHash")
{
    std::vector<Order> const orders{
        makeOrder(alice, tokenX, tokenY, 100, 100),
        makeOrder(bob, tokenY, tokenZ, 100, 100),
        makeOrder(carol, tokenZ, tokenX, 100, 100)};

    SUBCASE("digest of the concatenated order hashes")
    {
        std::vector<std::uint8_t> bytes;
        for (auto const& order : orders)
            bytes.insert(bytes.end(), order.hash.begin(), order.hash.end());

        CHECK(ringHash(orders) == sha3_256(bytes.data(), bytes.size()));
    }

    SUBCASE("deterministic")
    {
        CHECK(ringHash(orders) == ringHash(orders));
    }

    SUBCASE("sensitive to order sequence")
    {
        std::vector<Order> const rotated{orders[1], orders[2], orders[0]};
        CHECK(ringHash(orders) != ringHash(rotated));
    }

    SUBCASE("ignores everything but the order hashes")
    {
        auto changed = orders;
        changed[0].amountS = 7;
        changed[1].valid = false;
        CHECK(ringHash(orders) == ringHash(changed));
    }

    SUBCASE("empty ring")
    {
        CHECK(
            to_string(ringHash({})) ==
            "a7ffc6f8bf1ed76651c14756a061d662"
            "f580ff4de43b49fa82d80a4b80f8434a");
    }
}
