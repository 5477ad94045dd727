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
#ifndef RINGSETTLE_BASICS_STRINGUTILITIES_H_INCLUDED
#define RINGSETTLE_BASICS_STRINGUTILITIES_H_INCLUDED

#include <boost/algorithm/string/predicate.hpp>

#include <string>

namespace ringsettle {

/** Case-insensitive ordering, used for section and partition names. */
struct iless
{
    bool
    operator()(std::string const& lhs, std::string const& rhs) const
    {
        return boost::algorithm::ilexicographical_compare(lhs, rhs);
    }
};

/** Returns a copy of the string with leading and trailing whitespace
    removed.
*/
std::string
trim_whitespace(std::string str);

/** Removes a leading "0x" or "0X" from a hexadecimal string, if present. */
std::string
stripHexPrefix(std::string const& str);

}  // namespace ringsettle

#endif
