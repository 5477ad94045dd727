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

#ifndef RINGSETTLE_BASICS_BASE_UINT_H_INCLUDED
#define RINGSETTLE_BASICS_BASE_UINT_H_INCLUDED

#include <ringsettle/basics/contract.h>
#include <ringsettle/basics/strHex.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ringsettle {

/** Integers of any length that is a multiple of 32-bits

    @note This class stores its values internally in big-endian
          form. The byte sequence is what gets hashed when the value
          takes part in a digest, so it must not be reordered.

          @tparam Bits The number of bits this integer should have; must
                       be at least 64 and a multiple of 32.
          @tparam Tag An arbitrary type that functions as a tag and allows
                      the instantiation of "distinct" types that the same
                      number of bits.
 */
template <std::size_t Bits, class Tag = void>
class base_uint
{
    static_assert(
        (Bits % 32) == 0,
        "The length of a base_uint in bits must be a multiple of 32.");

    static_assert(
        Bits >= 64,
        "The length of a base_uint in bits must be at least 64.");

    std::array<std::uint8_t, Bits / 8> data_;

public:
    static std::size_t constexpr bytes = Bits / 8;
    static_assert(sizeof(data_) == bytes, "");

    using value_type = unsigned char;
    using pointer = value_type*;
    using const_pointer = value_type const*;
    using iterator = pointer;
    using const_iterator = const_pointer;
    using tag_type = Tag;

    pointer
    data()
    {
        return data_.data();
    }
    const_pointer
    data() const
    {
        return data_.data();
    }

    iterator
    begin()
    {
        return data();
    }
    iterator
    end()
    {
        return data() + bytes;
    }
    const_iterator
    begin() const
    {
        return data();
    }
    const_iterator
    end() const
    {
        return data() + bytes;
    }
    const_iterator
    cbegin() const
    {
        return data();
    }
    const_iterator
    cend() const
    {
        return data() + bytes;
    }

private:
    enum class ParseResult {
        okay,
        badLength,
        badChar,
    };

    static constexpr int
    hexNibble(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 0xA;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 0xA;
        return -1;
    }

    static constexpr std::pair<ParseResult, decltype(data_)>
    parseFromStringView(std::string_view sv) noexcept
    {
        std::pair<ParseResult, decltype(data_)> ret{ParseResult::okay, {}};

        if (sv == "0")
            return ret;

        if (sv.size() != size() * 2)
        {
            ret.first = ParseResult::badLength;
            return ret;
        }

        for (std::size_t i = 0; i != size(); ++i)
        {
            int const hi = hexNibble(sv[2 * i]);
            int const lo = hexNibble(sv[2 * i + 1]);
            if (hi < 0 || lo < 0)
            {
                ret.first = ParseResult::badChar;
                return ret;
            }
            ret.second[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        }
        return ret;
    }

    static decltype(data_)
    parseFromStringViewThrows(std::string_view sv) noexcept(false)
    {
        auto const result = parseFromStringView(sv);
        if (result.first == ParseResult::badLength)
            Throw<std::invalid_argument>("invalid length for hex string");

        if (result.first == ParseResult::badChar)
            Throw<std::range_error>("invalid hex character");

        return result.second;
    }

public:
    constexpr base_uint() : data_{}
    {
    }

    explicit base_uint(std::string_view sv) noexcept(false)
        : data_(parseFromStringViewThrows(sv))
    {
    }

    /** Construct from a raw pointer.
        The buffer pointed to by `data` must be at least Bits/8 bytes.
    */
    static base_uint
    fromVoid(void const* data)
    {
        base_uint result;
        std::memcpy(result.data_.data(), data, bytes);
        return result;
    }

    constexpr int
    signum() const
    {
        for (auto const b : data_)
            if (b != 0)
                return 1;

        return 0;
    }

    bool
    isZero() const
    {
        return signum() == 0;
    }

    /** Parse a hex string into a base_uint

        The input must be precisely `2 * bytes` hexadecimal characters
        long, with one exception: the value '0'.

        @return true if the input was parsed properly; false otherwise.
     */
    [[nodiscard]] constexpr bool
    parseHex(std::string_view sv)
    {
        auto const result = parseFromStringView(sv);
        if (result.first != ParseResult::okay)
            return false;

        data_ = result.second;
        return true;
    }

    constexpr static std::size_t
    size()
    {
        return bytes;
    }

    template <class Hasher>
    friend void
    hash_append(Hasher& h, base_uint const& a)
    {
        h(a.data_.data(), sizeof(a.data_));
    }

    friend bool
    operator==(base_uint const& a, base_uint const& b) = default;

    friend auto
    operator<=>(base_uint const& a, base_uint const& b) = default;
};

using uint160 = base_uint<160>;
using uint256 = base_uint<256>;

template <std::size_t Bits, class Tag>
inline std::string
to_string(base_uint<Bits, Tag> const& a)
{
    return strHex(a.cbegin(), a.cend());
}

template <std::size_t Bits, class Tag>
inline std::ostream&
operator<<(std::ostream& out, base_uint<Bits, Tag> const& u)
{
    return out << to_string(u);
}

static_assert(sizeof(uint160) == 160 / 8, "There should be no padding bytes");
static_assert(sizeof(uint256) == 256 / 8, "There should be no padding bytes");

}  // namespace ringsettle

#endif
