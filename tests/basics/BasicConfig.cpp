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


#include <ringsettle/basics/BasicConfig.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace ringsettle;

namespace {

class TestConfig : public BasicConfig
{
public:
    void
    load(IniFileSections const& ifs)
    {
        build(ifs);
    }
};

}  // namespace

TEST_CASE("Section settings and values")
{
    Section s("balances");
    s.append(
        {"scale = 18",
         "0x01 0x11 100  # alice",
         "0x02 0x12 250",
         "note=\\#1",
         "# only a comment"});

    CHECK(s.name() == "balances");
    CHECK(s.exists("scale"));
    CHECK_FALSE(s.exists("missing"));
    CHECK(*s.get("note") == "#1");

    REQUIRE(s.values().size() == 2);
    CHECK(s.values()[0] == "0x01 0x11 100");
    CHECK(s.values()[1] == "0x02 0x12 250");

    SUBCASE("typed lookup")
    {
        CHECK(*s.get<int>("scale") == 18);
        CHECK_FALSE(s.get<int>("missing").has_value());
        CHECK_THROWS_AS(s.get<int>("note"), std::runtime_error);
    }

    SUBCASE("required settings")
    {
        CHECK(s.required<int>("scale") == 18);
        CHECK(s.required("note") == "#1");
        CHECK_THROWS_WITH_AS(
            s.required("missing"),
            "Missing balances.missing",
            std::runtime_error);
        CHECK_THROWS_WITH_AS(
            s.required<int>("note"),
            "Invalid balances.note: #1",
            std::runtime_error);
    }

    SUBCASE("a later setting replaces an earlier one")
    {
        s.append("scale = 6");
        CHECK(s.required<int>("scale") == 6);
        s.set("scale", "9");
        CHECK(s.required<int>("scale") == 9);
    }
}

TEST_CASE("BasicConfig sections")
{
    TestConfig c;
    c.load({{"ring", {"owner=0x31"}}, {"Tokens", {"0x11", "0x12"}}});

    CHECK(c.exists("ring"));
    CHECK(c.exists("tokens"));
    CHECK_FALSE(c.exists("balances"));

    CHECK(c.section("TOKENS").values().size() == 2);
    CHECK(c.section("balances").values().empty());
    CHECK_FALSE(c.section("balances").get("owner").has_value());
    CHECK_FALSE(c.exists("balances"));

    SUBCASE("building again appends to existing sections")
    {
        c.load({{"tokens", {"0x13"}}, {"ring", {"owner=0x32"}}});
        CHECK(c.section("tokens").values().size() == 3);
        CHECK(*c.section("ring").get("owner") == "0x32");
    }
}
