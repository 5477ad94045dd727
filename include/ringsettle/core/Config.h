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

#ifndef RINGSETTLE_CORE_CONFIG_H_INCLUDED
#define RINGSETTLE_CORE_CONFIG_H_INCLUDED

#include <ringsettle/basics/BasicConfig.h>
#include <ringsettle/basics/Journal.h>
#include <ringsettle/protocol/AccountID.h>

#include <boost/filesystem.hpp>

#include <optional>
#include <string>

namespace ringsettle {

/** Split ini-formatted text into sections.

    Lines before the first `[section]` header land in the section
    with the empty name. Blank lines and lines starting with `#` are
    dropped.

    @param bTrim Strip leading and trailing whitespace from each line.
*/
IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim);

/** Settlement configuration.

    @code
    [settlement]
    fee_holder=0x...
    wallet_split_percentage=20

    [logging]
    severity=debug
    file=/var/log/ringsettle.log
    @endcode
*/
class Config : public BasicConfig
{
public:
    // Receives fees and spread. Required before a ring can be settled.
    std::optional<AccountID> feeHolder;

    int walletSplitPercentage = 0;

    severities::Severity logSeverity = severities::kInfo;

    // Empty if logging only goes to the console
    boost::filesystem::path logFile;

public:
    Config() = default;

    /** Load the configuration from a file.

        @throws std::runtime_error if the file cannot be read or a
                value is malformed.
    */
    void
    setup(boost::filesystem::path const& configFile);

    /** Load the configuration from a string.

        @throws std::runtime_error if a value is malformed.
    */
    void
    loadFromString(std::string const& fileContents);

    boost::filesystem::path const&
    configFile() const
    {
        return configFile_;
    }

private:
    boost::filesystem::path configFile_;
};

}  // namespace ringsettle

#endif
