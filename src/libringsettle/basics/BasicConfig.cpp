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

#include <boost/regex.hpp>

namespace ringsettle {

namespace {

// Removes a trailing comment, honouring `\#` as a literal '#'.
void
stripComment(std::string& line)
{
    for (auto pos = line.find('#'); pos != std::string::npos;
         pos = line.find('#', pos))
    {
        if (pos == 0 || line[pos - 1] != '\\')
        {
            line = trim_whitespace(line.substr(0, pos));
            return;
        }
        line.erase(pos - 1, 1);
    }
}

}  // namespace

Section::Section(std::string const& name) : name_(name)
{
}

void
Section::set(std::string const& key, std::string const& value)
{
    settings_.insert_or_assign(key, value);
}

void
Section::append(std::vector<std::string> const& lines)
{
    // key = value, with the key starting with a letter
    static boost::regex const setting(
        "^\\s*([a-zA-Z][_a-zA-Z0-9]*)\\s*=\\s*(.*\\S)\\s*$",
        boost::regex_constants::optimize);

    for (auto line : lines)
    {
        stripComment(line);
        if (line.empty())
            continue;

        boost::smatch match;
        if (boost::regex_match(line, match, setting))
            set(match[1], match[2]);
        else
            values_.push_back(std::move(line));
    }
}

bool
Section::exists(std::string const& key) const
{
    return settings_.count(key) != 0;
}

std::string
Section::qualified(std::string const& key) const
{
    return name_.empty() ? key : name_ + "." + key;
}

//------------------------------------------------------------------------------

bool
BasicConfig::exists(std::string const& name) const
{
    return map_.count(name) != 0;
}

Section const&
BasicConfig::section(std::string const& name) const
{
    static Section const none;
    auto const iter = map_.find(name);
    if (iter == map_.end())
        return none;
    return iter->second;
}

void
BasicConfig::build(IniFileSections const& ifs)
{
    for (auto const& [name, lines] : ifs)
        map_.try_emplace(name, name).first->second.append(lines);
}

}  // namespace ringsettle
