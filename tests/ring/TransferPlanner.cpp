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

#include <ringsettle/ring/SettlementErrors.h>
#include <ringsettle/ring/TransferPlanner.h>

#include <tests/ring/RingFixtures.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace ringsettle;
using namespace ringsettle::test;

namespace {

Order
fitted(
    Order order,
    TokenAmount const& fillS,
    TokenAmount const& fillB,
    TokenAmount const& fee = 0,
    TokenAmount const& splitS = 0)
{
    order.fillAmountS = fillS;
    order.fillAmountB = fillB;
    order.fillAmountFee = fee;
    order.splitS = splitS;
    return order;
}

}  // namespace

TEST_CASE("TransferPlanner")
{
    CaptureSink sink;
    TransferPlanner planner(account(feeHolder), Journal(sink));

    SUBCASE("principal goes to the previous order's owner")
    {
        std::vector<Order> const orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100), 100, 100),
            fitted(makeOrder(bob, tokenY, tokenX, 100, 100), 100, 100)};

        auto const items = planner.getRingTransferItems(orders, true, 0);
        REQUIRE(items.size() == 2);
        CHECK(
            items[0] ==
            TransferItem{account(tokenX), account(alice), account(bob), 100});
        CHECK(
            items[1] ==
            TransferItem{account(tokenY), account(bob), account(alice), 100});
        CHECK(sink.contains("expected rate"));
    }

    SUBCASE("fee and spread follow the principal")
    {
        std::vector<Order> const orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100, 10), 100, 100, 10),
            fitted(
                makeOrder(bob, tokenY, tokenX, 120, 100), 100, 100, 0, 20)};

        auto const items = planner.getRingTransferItems(orders, true, 0);
        REQUIRE(items.size() == 4);
        CHECK(
            items[0] ==
            TransferItem{account(tokenX), account(alice), account(bob), 100});
        CHECK(
            items[1] ==
            TransferItem{
                account(feeToken), account(alice), account(feeHolder), 10});
        CHECK(
            items[2] ==
            TransferItem{account(tokenY), account(bob), account(alice), 100});
        CHECK(
            items[3] ==
            TransferItem{
                account(tokenY), account(bob), account(feeHolder), 20});
    }

    SUBCASE("an order with nothing to sell emits nothing")
    {
        std::vector<Order> const orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100), 0, 0),
            fitted(makeOrder(bob, tokenY, tokenX, 100, 100), 0, 0)};

        CHECK(planner.getRingTransferItems(orders, true, 0).empty());
    }

    SUBCASE("wallet split does not change routing")
    {
        std::vector<Order> orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100, 10), 100, 100, 10),
            fitted(makeOrder(bob, tokenY, tokenX, 100, 100), 100, 100)};
        orders[0].walletAddr = account(miner);

        CHECK(
            planner.getRingTransferItems(orders, true, 50) ==
            planner.getRingTransferItems(orders, true, 0));
        CHECK(planner.getRingTransferItems(orders, true, 100).size() == 3);
    }

    SUBCASE("an invalid ring yields an empty plan")
    {
        std::vector<Order> const orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100), 100, 100),
            fitted(makeOrder(bob, tokenY, tokenX, 100, 100), 100, 100)};

        CHECK(planner.getRingTransferItems(orders, false, 0).empty());
        CHECK(sink.contains("ring cannot be settled"));
    }

    SUBCASE("wallet split percentage is range checked first")
    {
        std::vector<Order> const orders{
            fitted(makeOrder(alice, tokenX, tokenY, 100, 100), 100, 100),
            fitted(makeOrder(bob, tokenY, tokenX, 100, 100), 100, 100)};

        CHECK_THROWS_AS(
            planner.getRingTransferItems(orders, true, 101),
            std::invalid_argument);
        CHECK_THROWS_AS(
            planner.getRingTransferItems(orders, true, -1),
            std::invalid_argument);
        CHECK_THROWS_AS(
            planner.getRingTransferItems(orders, false, 101),
            std::invalid_argument);
    }
}

TEST_CASE("TransferPlanner invariants")
{
    CaptureSink sink;
    TransferPlanner planner(account(feeHolder), Journal(sink));

    auto const good =
        fitted(makeOrder(bob, tokenY, tokenX, 100, 100, 10), 100, 100, 10);

    auto check = [&](Order const& bad) {
        std::vector<Order> const orders{bad, good};
        CHECK_THROWS_AS(
            planner.getRingTransferItems(orders, true, 0),
            InvariantViolation);
    };

    auto const base = makeOrder(alice, tokenX, tokenY, 100, 100, 10);

    check(fitted(base, 101, 100));
    check(fitted(base, 90, 90, 0, 20));
    check(fitted(base, 50, 50, 11));
    check(fitted(base, -1, 0));
    check(fitted(base, 50, 50, 0, -1));
    check(fitted(base, 50, 50, -1));

    // Checked even when nothing would be transferred
    check(fitted(base, 0, 0, 11));
}
