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


#include <ringsettle/ring/RingPosition.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace ringsettle;

TEST_CASE("ring positions wrap around")
{
    CHECK(prevIndex(0, 3) == 2);
    CHECK(prevIndex(2, 3) == 1);
    CHECK(nextIndex(2, 3) == 0);
    CHECK(nextIndex(0, 3) == 1);

    CHECK(prevIndex(0, 1) == 0);
    CHECK(nextIndex(0, 1) == 0);
}

TEST_CASE("ring positions out of range")
{
    CHECK_THROWS_AS(prevIndex(0, 0), std::out_of_range);
    CHECK_THROWS_AS(nextIndex(0, 0), std::out_of_range);
    CHECK_THROWS_AS(nextIndex(3, 3), std::out_of_range);
}
