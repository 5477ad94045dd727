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

#ifndef RINGSETTLE_PROTOCOL_TRANSFERITEM_H_INCLUDED
#define RINGSETTLE_PROTOCOL_TRANSFERITEM_H_INCLUDED

#include <ringsettle/protocol/AccountID.h>
#include <ringsettle/protocol/TokenAmount.h>

#include <ostream>

namespace ringsettle {

/** One elementary token movement produced by settling a ring. */
struct TransferItem
{
    AccountID token;
    AccountID from;
    AccountID to;
    TokenAmount amount = 0;
};

inline bool
operator==(TransferItem const& lhs, TransferItem const& rhs)
{
    return lhs.token == rhs.token && lhs.from == rhs.from &&
        lhs.to == rhs.to && lhs.amount == rhs.amount;
}

inline std::ostream&
operator<<(std::ostream& os, TransferItem const& item)
{
    return os << toAddress(item.from) << " -> " << toAddress(item.to) << " "
              << item.amount << " " << toAddress(item.token);
}

}  // namespace ringsettle

#endif
