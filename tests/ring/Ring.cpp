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

#include <ringsettle/ring/BalanceSheet.h>
#include <ringsettle/ring/Ring.h>
#include <ringsettle/ring/RingIdentity.h>
#include <ringsettle/ring/SettlementErrors.h>

#include <tests/ring/RingFixtures.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace ringsettle;
using namespace ringsettle::test;

namespace {

class CountingRegistry : public TokenRegistry
{
public:
    mutable int queries = 0;

    bool
    areAllTokensRegistered(std::vector<AccountID> const&) const override
    {
        ++queries;
        return false;
    }
};

struct RingSetup
{
    CaptureSink sink;
    BalanceSheet sheet;
    SettlementContext ctx{sheet, sheet, account(feeHolder)};

    Ring
    make(std::vector<Order> orders)
    {
        return Ring(
            ctx, std::move(orders), account(miner), account(feeHolder),
            Journal(sink));
    }
};

}  // namespace

TEST_CASE("Ring settle")
{
    RingSetup s;

    std::vector<Order> orders{
        makeOrder(alice, tokenX, tokenY, 100, 100, 10),
        makeOrder(bob, tokenY, tokenX, 120, 100)};
    fund(s.sheet, orders);

    SUBCASE("end to end")
    {
        Ring ring = s.make(orders);
        auto const items = ring.settle(0);

        CHECK(ring.valid());
        CHECK(ring.hash() == ringHash(orders));
        CHECK(ring.rate() == doctest::Approx(1.2));

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

    SUBCASE("reciprocal orders at the same price")
    {
        std::vector<Order> reciprocal{
            makeOrder(alice, tokenX, tokenY, 100, 120),
            makeOrder(bob, tokenY, tokenX, 120, 100)};
        BalanceSheet sheet;
        fund(sheet, reciprocal);
        SettlementContext ctx{sheet, sheet, account(feeHolder)};
        Ring ring(
            ctx, reciprocal, account(miner), account(feeHolder),
            Journal(s.sink));

        auto const items = ring.settle(0);
        REQUIRE(ring.valid());

        auto const& a = ring.orders()[0];
        auto const& b = ring.orders()[1];
        CHECK(a.fillAmountS == 100);
        CHECK(a.fillAmountB == 120);
        CHECK(a.splitS == 0);
        CHECK(b.fillAmountS == 120);
        CHECK(b.fillAmountB == 100);
        CHECK(b.splitS == 0);

        REQUIRE(items.size() == 2);
        CHECK(
            items[0] ==
            TransferItem{account(tokenX), account(alice), account(bob), 100});
        CHECK(
            items[1] ==
            TransferItem{account(tokenY), account(bob), account(alice), 120});
    }

    SUBCASE("planning twice gives the same transfers")
    {
        Ring ring = s.make(orders);
        auto const first = ring.settle(0);
        REQUIRE_FALSE(first.empty());

        CHECK(ring.getRingTransferItems(0) == first);
        CHECK(ring.getRingTransferItems(0) == ring.getRingTransferItems(0));
    }

    SUBCASE("invalid order yields an empty plan without fitting")
    {
        orders[1].valid = false;
        Ring ring = s.make(orders);

        CHECK(ring.settle(0).empty());
        CHECK_FALSE(ring.valid());
        CHECK(ring.orders()[0].fillAmountS == 0);
    }

    SUBCASE("unregistered token yields an empty plan")
    {
        BalanceSheet empty;
        SettlementContext ctx{s.sheet, empty, account(feeHolder)};
        Ring ring(ctx, orders, account(miner), account(feeHolder),
                  Journal(s.sink));

        CHECK(ring.settle(0).empty());
        CHECK_FALSE(ring.valid());
    }

    SUBCASE("spendable balance of zero invalidates nothing")
    {
        s.sheet.setBalance(account(alice), account(tokenX), 0);
        Ring ring = s.make(orders);

        CHECK(ring.settle(0).empty());
        CHECK(ring.valid());
        CHECK(ring.orders()[1].fillAmountS == 0);
    }

    SUBCASE("bad wallet split is rejected")
    {
        Ring ring = s.make(orders);
        CHECK_THROWS_AS(ring.settle(101), std::invalid_argument);
    }
}

TEST_CASE("Ring lifecycle")
{
    RingSetup s;

    SUBCASE("unsettleable ring is marked invalid")
    {
        std::vector<Order> orders{
            makeOrder(alice, tokenX, tokenY, 100, 200),
            makeOrder(bob, tokenY, tokenX, 100, 100)};
        fund(s.sheet, orders);
        Ring ring = s.make(orders);

        ring.checkOrdersValid();
        ring.checkTokensRegistered();
        REQUIRE(ring.valid());

        CHECK_THROWS_AS(ring.calculateFillAmountAndFee(), UnsettleableRing);
        CHECK_FALSE(ring.valid());
        CHECK(ring.getRingTransferItems(0).empty());
    }

    SUBCASE("a failing scaler invalidates the ring")
    {
        ScriptedScaler scaler;
        scaler.throwAt = 1;
        SettlementContext ctx{scaler, s.sheet, account(feeHolder)};
        Ring ring(
            ctx,
            {makeOrder(alice, tokenX, tokenY, 100, 100),
             makeOrder(bob, tokenY, tokenX, 100, 100)},
            account(miner),
            account(feeHolder),
            Journal(s.sink));

        CHECK_THROWS_AS(ring.calculateFillAmountAndFee(), std::runtime_error);
        CHECK_FALSE(ring.valid());
    }

    SUBCASE("scaling that invalidates an order invalidates the ring")
    {
        ScriptedScaler scaler;
        scaler.invalidate = 0;
        SettlementContext ctx{scaler, s.sheet, account(feeHolder)};
        Ring ring(
            ctx,
            {makeOrder(alice, tokenX, tokenY, 100, 100),
             makeOrder(bob, tokenY, tokenX, 100, 100)},
            account(miner),
            account(feeHolder),
            Journal(s.sink));

        ring.calculateFillAmountAndFee();
        CHECK_FALSE(ring.valid());
        CHECK(ring.getRingTransferItems(0).empty());
    }

    SUBCASE("validity never comes back")
    {
        std::vector<Order> orders{
            makeOrder(alice, tokenX, tokenY, 100, 100),
            makeOrder(bob, tokenY, tokenX, 100, 100)};
        orders[0].valid = false;
        fund(s.sheet, orders);
        Ring ring = s.make(orders);

        ring.checkOrdersValid();
        CHECK_FALSE(ring.valid());
        ring.checkTokensRegistered();
        CHECK_FALSE(ring.valid());
    }

    SUBCASE("checks run even on an invalid ring")
    {
        std::vector<Order> orders{
            makeOrder(alice, tokenX, tokenY, 100, 100),
            makeOrder(bob, tokenY, tokenX, 100, 100)};
        orders[0].valid = false;
        orders[1].valid = false;

        CountingRegistry registry;
        SettlementContext ctx{s.sheet, registry, account(feeHolder)};
        Ring ring(ctx, orders, account(miner), account(feeHolder),
                  Journal(s.sink));

        ring.checkOrdersValid();
        REQUIRE_FALSE(ring.valid());
        s.sink.lines.clear();

        ring.checkOrdersValid();
        CHECK(s.sink.contains("position 0"));
        CHECK(s.sink.contains("position 1"));

        ring.checkTokensRegistered();
        CHECK(registry.queries == 1);
        CHECK(s.sink.contains("unregistered token"));
        CHECK_FALSE(ring.valid());
    }

    SUBCASE("hash is cached until updated")
    {
        std::vector<Order> orders{
            makeOrder(alice, tokenX, tokenY, 100, 100),
            makeOrder(bob, tokenY, tokenX, 100, 100)};
        Ring ring = s.make(orders);

        auto const first = ring.hash();
        CHECK(first == ringHash(orders));
        ring.updateHash();
        CHECK(ring.hash() == first);
    }

    SUBCASE("accessors")
    {
        Ring ring = s.make(
            {makeOrder(alice, tokenX, tokenY, 100, 100),
             makeOrder(bob, tokenY, tokenZ, 100, 100),
             makeOrder(carol, tokenZ, tokenX, 100, 100)});

        CHECK(ring.size() == 3);
        CHECK(ring.owner() == account(miner));
        CHECK(ring.feeRecipient() == account(feeHolder));
        CHECK(ring.rate() == 0.0);
    }
}
