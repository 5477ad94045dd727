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

#ifndef RINGSETTLE_RING_SETTLEMENTERRORS_H_INCLUDED
#define RINGSETTLE_RING_SETTLEMENTERRORS_H_INCLUDED

#include <stdexcept>
#include <string>

namespace ringsettle {

/** The fitted amounts of adjacent orders cannot be made to balance. */
class UnsettleableRing : public std::runtime_error
{
public:
    explicit UnsettleableRing(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/** A fitted order broke one of the amount invariants.

    This indicates a defect in the fitter or in a spendable scaler.
*/
class InvariantViolation : public std::logic_error
{
public:
    explicit InvariantViolation(std::string const& what)
        : std::logic_error(what)
    {
    }
};

}  // namespace ringsettle

#endif
