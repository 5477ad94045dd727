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

#include <ringsettle/basics/Log.h>
#include <ringsettle/basics/contract.h>
#include <ringsettle/core/Config.h>
#include <ringsettle/core/ConfigSections.h>

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace ringsettle {

IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim)
{
    std::string strData(strInput);
    std::vector<std::string> vLines;
    IniFileSections secResult;

    // Convert DOS format to unix.
    boost::algorithm::replace_all(strData, "\r\n", "\n");

    // Convert MacOS format to unix.
    boost::algorithm::replace_all(strData, "\r", "\n");

    boost::algorithm::split(vLines, strData, boost::algorithm::is_any_of("\n"));

    // Set the default section name.
    std::string strSection;

    // Initialize the default section.
    secResult[strSection] = IniFileSections::mapped_type();

    for (auto& strValue : vLines)
    {
        if (bTrim)
            boost::algorithm::trim(strValue);

        if (strValue.empty() || strValue[0] == '#')
        {
            // Blank line or comment, do nothing.
        }
        else if (strValue[0] == '[' && strValue[strValue.length() - 1] == ']')
        {
            // New section.
            strSection = strValue.substr(1, strValue.length() - 2);
            secResult.emplace(strSection, IniFileSections::mapped_type{});
        }
        else
        {
            // Another line for the current section.
            secResult[strSection].push_back(strValue);
        }
    }

    return secResult;
}

//------------------------------------------------------------------------------

void
Config::setup(boost::filesystem::path const& configFile)
{
    configFile_ = configFile;

    std::ifstream ifsConfig(configFile.c_str(), std::ios::in);
    if (!ifsConfig)
        Throw<std::runtime_error>(
            "Failed to open '" + configFile.string() + "'");

    std::string fileContents;
    fileContents.assign(
        (std::istreambuf_iterator<char>(ifsConfig)),
        std::istreambuf_iterator<char>());

    if (ifsConfig.bad())
        Throw<std::runtime_error>(
            "Failed to read '" + configFile.string() + "'");

    loadFromString(fileContents);
}

void
Config::loadFromString(std::string const& fileContents)
{
    build(parseIniFile(fileContents, true));

    auto const& settlement = section(SECTION_SETTLEMENT);

    if (auto const holder = settlement.get("fee_holder"))
    {
        feeHolder = parseAccountID(*holder);
        if (!feeHolder)
            Throw<std::runtime_error>(
                "Invalid " SECTION_SETTLEMENT ".fee_holder: " + *holder);
    }

    if (auto const split = settlement.get<int>("wallet_split_percentage"))
    {
        if (*split < 0 || *split > 100)
            Throw<std::runtime_error>(
                SECTION_SETTLEMENT
                ".wallet_split_percentage must be within [0, 100]");
        walletSplitPercentage = *split;
    }

    auto const& logging = section(SECTION_LOGGING);

    if (auto const severity = logging.get("severity"))
    {
        auto const parsed = Logs::fromString(*severity);
        if (!parsed)
            Throw<std::runtime_error>(
                "Invalid " SECTION_LOGGING ".severity: " + *severity);
        logSeverity = *parsed;
    }

    if (auto const file = logging.get("file"))
        logFile = *file;
}

}  // namespace ringsettle
