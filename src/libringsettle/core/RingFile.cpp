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

#include <ringsettle/basics/StringUtilities.h>
#include <ringsettle/basics/contract.h>
#include <ringsettle/core/Config.h>
#include <ringsettle/core/RingFile.h>

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace ringsettle {

namespace {

AccountID
toAccount(std::string const& where, std::string const& text)
{
    auto const account = parseAccountID(text);
    if (!account)
        Throw<std::runtime_error>("Invalid address in " + where + ": " + text);
    return *account;
}

TokenAmount
toAmount(std::string const& where, std::string const& text)
{
    auto const amount = parseTokenAmount(text);
    if (!amount)
        Throw<std::runtime_error>("Invalid amount in " + where + ": " + text);
    return *amount;
}

Order
parseOrder(Section const& section)
{
    auto const& name = section.name();

    Order order;

    auto const hash = stripHexPrefix(section.required("hash"));
    if (!order.hash.parseHex(hash))
        Throw<std::runtime_error>("Invalid hash in " + name + ": " + hash);

    order.owner = toAccount(name, section.required("owner"));
    order.tokenS = toAccount(name, section.required("token_s"));
    order.tokenB = toAccount(name, section.required("token_b"));
    order.amountS = toAmount(name, section.required("amount_s"));
    order.amountB = toAmount(name, section.required("amount_b"));

    if (auto const v = section.get("fee_token"))
        order.feeToken = toAccount(name, *v);
    if (auto const v = section.get("fee_amount"))
        order.feeAmount = toAmount(name, *v);
    if (auto const v = section.get("wallet"))
        order.walletAddr = toAccount(name, *v);

    if (auto const v = section.get("valid"))
    {
        if (boost::iequals(*v, "true") || *v == "1")
            order.valid = true;
        else if (boost::iequals(*v, "false") || *v == "0")
            order.valid = false;
        else
            Throw<std::runtime_error>(
                "Invalid valid flag in " + name + ": " + *v);
    }

    return order;
}

}  // namespace

void
RingFile::setup(boost::filesystem::path const& ringFile)
{
    std::ifstream ifs(ringFile.c_str(), std::ios::in);
    if (!ifs)
        Throw<std::runtime_error>(
            "Failed to open '" + ringFile.string() + "'");

    std::string fileContents;
    fileContents.assign(
        (std::istreambuf_iterator<char>(ifs)),
        std::istreambuf_iterator<char>());

    if (ifs.bad())
        Throw<std::runtime_error>(
            "Failed to read '" + ringFile.string() + "'");

    loadFromString(fileContents);
}

void
RingFile::loadFromString(std::string const& fileContents)
{
    build(parseIniFile(fileContents, true));

    auto const& ring = section("ring");
    owner = toAccount("ring", ring.required("owner"));
    feeRecipient = toAccount("ring", ring.required("fee_recipient"));

    orders.clear();
    for (std::size_t k = 0;; ++k)
    {
        auto const name = "order." + std::to_string(k);
        if (!exists(name))
            break;
        orders.push_back(parseOrder(section(name)));
    }

    if (orders.empty())
        Throw<std::runtime_error>("Ring has no [order.0] section");

    balances.clear();
    for (auto const& line : section("balances").values())
    {
        std::vector<std::string> fields;
        boost::algorithm::split(
            fields,
            line,
            boost::algorithm::is_space(),
            boost::algorithm::token_compress_on);

        if (fields.size() != 3)
            Throw<std::runtime_error>("Invalid balance line: " + line);

        balances.push_back(
            {toAccount("balances", fields[0]),
             toAccount("balances", fields[1]),
             toAmount("balances", fields[2])});
    }

    tokens.clear();
    for (auto const& line : section("tokens").values())
        tokens.push_back(toAccount("tokens", line));
}

void
RingFile::populate(BalanceSheet& sheet) const
{
    for (auto const& balance : balances)
        sheet.setBalance(balance.owner, balance.token, balance.amount);

    for (auto const& token : tokens)
        sheet.registerToken(token);
}

}  // namespace ringsettle
