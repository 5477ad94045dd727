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

#include <ringsettle/core/RingFile.h>
#include <ringsettle/ring/BalanceSheet.h>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace ringsettle;

namespace {

std::string const ringText =
    "[ring]\n"
    "owner=0x0000000000000000000000000000000000000031\n"
    "fee_recipient=0x0000000000000000000000000000000000000030\n"
    "\n"
    "[order.0]\n"
    "hash=0x00000000000000000000000000000000000000000000000000000000000000a1\n"
    "owner=0x0000000000000000000000000000000000000001\n"
    "token_s=0x0000000000000000000000000000000000000011\n"
    "token_b=0x0000000000000000000000000000000000000012\n"
    "amount_s=100\n"
    "amount_b=100\n"
    "fee_token=0x0000000000000000000000000000000000000020\n"
    "fee_amount=10\n"
    "\n"
    "[order.1]\n"
    "hash=00000000000000000000000000000000000000000000000000000000000000a2\n"
    "owner=0x0000000000000000000000000000000000000002\n"
    "token_s=0x0000000000000000000000000000000000000012\n"
    "token_b=0x0000000000000000000000000000000000000011\n"
    "amount_s=120\n"
    "amount_b=100\n"
    "wallet=0x0000000000000000000000000000000000000040\n"
    "valid=false\n"
    "\n"
    "[balances]\n"
    "0x0000000000000000000000000000000000000001 "
    "0x0000000000000000000000000000000000000011 100\n"
    "0x0000000000000000000000000000000000000002\t"
    "0x0000000000000000000000000000000000000012   120\n"
    "\n"
    "[tokens]\n"
    "0x0000000000000000000000000000000000000011\n"
    "0x0000000000000000000000000000000000000012\n";

}  // namespace

TEST_CASE("RingFile")
{
    RingFile rf;
    rf.loadFromString(ringText);

    CHECK(rf.owner.data()[19] == 0x31);
    CHECK(rf.feeRecipient.data()[19] == 0x30);

    REQUIRE(rf.orders.size() == 2);

    auto const& a = rf.orders[0];
    CHECK(a.hash.data()[31] == 0xa1);
    CHECK(a.owner.data()[19] == 0x01);
    CHECK(a.tokenS.data()[19] == 0x11);
    CHECK(a.tokenB.data()[19] == 0x12);
    CHECK(a.feeToken.data()[19] == 0x20);
    CHECK(a.amountS == 100);
    CHECK(a.amountB == 100);
    CHECK(a.feeAmount == 10);
    CHECK(a.valid);

    auto const& b = rf.orders[1];
    CHECK(b.hash.data()[31] == 0xa2);
    CHECK(b.amountS == 120);
    CHECK(b.feeAmount == 0);
    CHECK(b.walletAddr.data()[19] == 0x40);
    CHECK_FALSE(b.valid);

    REQUIRE(rf.balances.size() == 2);
    CHECK(rf.balances[1].amount == 120);
    CHECK(rf.tokens.size() == 2);

    BalanceSheet sheet;
    rf.populate(sheet);
    CHECK(sheet.spendable(a.owner, a.tokenS) == 100);
    CHECK(sheet.spendable(b.owner, b.tokenS) == 120);
    CHECK(sheet.areAllTokensRegistered({a.tokenS, b.tokenS}));
}

TEST_CASE("RingFile errors")
{
    auto load = [](std::string const& text) {
        RingFile rf;
        rf.loadFromString(text);
    };

    auto without = [](std::string const& key) {
        auto text = ringText;
        auto const pos = text.find(key);
        REQUIRE(pos != std::string::npos);
        text.erase(pos, text.find('\n', pos) - pos);
        return text;
    };

    CHECK_THROWS_AS(load(without("fee_recipient=")), std::runtime_error);
    CHECK_THROWS_AS(load(without("amount_b=100")), std::runtime_error);
    CHECK_THROWS_AS(load(without("token_s=")), std::runtime_error);
    CHECK_THROWS_AS(load("[ring]\n"), std::runtime_error);

    CHECK_THROWS_AS(
        load("[ring]\n"
             "owner=0x0000000000000000000000000000000000000031\n"
             "fee_recipient=0x0000000000000000000000000000000000000030\n"),
        std::runtime_error);

    auto badAmount = ringText;
    badAmount.replace(badAmount.find("amount_s=100"), 12, "amount_s=1e2");
    CHECK_THROWS_AS(load(badAmount), std::runtime_error);

    auto badFlag = ringText;
    badFlag.replace(badFlag.find("valid=false"), 11, "valid=maybe");
    CHECK_THROWS_AS(load(badFlag), std::runtime_error);

    CHECK_THROWS_AS(
        load(ringText + "[balances]\n0x01 0x02\n"), std::runtime_error);
}
