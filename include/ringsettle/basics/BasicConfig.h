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


#ifndef RINGSETTLE_BASICS_BASICCONFIG_H_INCLUDED
#define RINGSETTLE_BASICS_BASICCONFIG_H_INCLUDED

#include <ringsettle/basics/StringUtilities.h>
#include <ringsettle/basics/contract.h>

#include <boost/lexical_cast.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ringsettle {

using IniFileSections = std::map<std::string, std::vector<std::string>>;

//------------------------------------------------------------------------------

/** One bracketed section of an INI style file.

    Lines of the form `key = value` are stored as settings. Any other
    non-empty line is kept, in order, as a bare value. A `#` starts a
    trailing comment unless it is escaped as `\#`.
*/
class Section
{
private:
    std::string name_;
    std::map<std::string, std::string> settings_;
    std::vector<std::string> values_;

public:
    explicit Section(std::string const& name = "");

    std::string const&
    name() const
    {
        return name_;
    }

    /** The bare lines of the section, in file order. */
    std::vector<std::string> const&
    values() const
    {
        return values_;
    }

    /** Set a setting, replacing any previous value for the key. */
    void
    set(std::string const& key, std::string const& value);

    /** Append raw lines, splitting them into settings and bare values. */
    void
    append(std::vector<std::string> const& lines);

    bool
    exists(std::string const& key) const;

    /** Retrieve a setting converted to T.

        @return std::nullopt if the key is absent.
        @throws std::runtime_error naming `section.key` if the text does
                not convert to T.
    */
    template <class T = std::string>
    std::optional<T>
    get(std::string const& key) const
    {
        auto const iter = settings_.find(key);
        if (iter == settings_.end())
            return std::nullopt;

        if constexpr (std::is_same_v<T, std::string>)
        {
            return iter->second;
        }
        else
        {
            try
            {
                return boost::lexical_cast<T>(iter->second);
            }
            catch (boost::bad_lexical_cast const&)
            {
                Throw<std::runtime_error>(
                    "Invalid " + qualified(key) + ": " + iter->second);
            }
        }
        return std::nullopt;
    }

    /** Retrieve a setting that must be present.
        @throws std::runtime_error naming `section.key` if it is absent.
    */
    template <class T = std::string>
    T
    required(std::string const& key) const
    {
        auto value = get<T>(key);
        if (!value)
            Throw<std::runtime_error>("Missing " + qualified(key));
        return std::move(*value);
    }

private:
    std::string
    qualified(std::string const& key) const;
};

//------------------------------------------------------------------------------

/** Sections of a parsed INI file, looked up without regard to case.

    Derived classes interpret the sections they know about and ignore
    the rest.
*/
class BasicConfig
{
private:
    std::map<std::string, Section, iless> map_;

public:
    bool
    exists(std::string const& name) const;

    /** Returns the named section, or an empty one if it is absent. */
    Section const&
    section(std::string const& name) const;

protected:
    /** Merge parsed sections into this configuration.
        Lines for a section that already exists are appended to it.
    */
    void
    build(IniFileSections const& ifs);
};

}  // namespace ringsettle

#endif
