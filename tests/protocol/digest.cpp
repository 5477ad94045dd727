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

#include <doctest/doctest.h>

#include <string>

using namespace ringsettle;

TEST_CASE("sha3_256 known answers")
{
    SUBCASE("empty message")
    {
        CHECK(
            to_string(sha3_256("", 0)) ==
            "a7ffc6f8bf1ed76651c14756a061d662"
            "f580ff4de43b49fa82d80a4b80f8434a");
    }

    SUBCASE("not the Keccak-256 padding")
    {
        CHECK(
            to_string(sha3_256("", 0)) !=
            "c5d2460186f7233c927e7db2dcc703c0"
            "e500b653ca82273b7bfad8045d85a470");
    }

    SUBCASE("abc")
    {
        std::string const msg = "abc";
        CHECK(
            to_string(sha3_256(msg.data(), msg.size())) ==
            "3a985da74fe225b2045c172d6bd390bd"
            "855f086e3e9d525b46bfe24511431532");
    }
}

TEST_CASE("sha3_256 hasher is incremental")
{
    std::string const msg = "ring settlement";

    sha3_256_hasher h;
    h(msg.data(), 4);
    h(msg.data() + 4, msg.size() - 4);
    auto const pieces = static_cast<sha3_256_hasher::result_type>(h);

    CHECK(pieces == sha3_256(msg.data(), msg.size()));
}

TEST_CASE("sha3_256 hash_append")
{
    uint256 a;
    REQUIRE(a.parseHex(
        "0102030405060708090a0b0c0d0e0f10"
        "1112131415161718191a1b1c1d1e1f20"));

    sha3_256_hasher h;
    hash_append(h, a);
    CHECK(
        static_cast<sha3_256_hasher::result_type>(h) ==
        sha3_256(a.data(), a.size()));
}
