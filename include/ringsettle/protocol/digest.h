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

#ifndef RINGSETTLE_PROTOCOL_DIGEST_H_INCLUDED
#define RINGSETTLE_PROTOCOL_DIGEST_H_INCLUDED

#include <ringsettle/basics/base_uint.h>

#include <openssl/evp.h>

#include <cstddef>
#include <memory>

namespace ringsettle {

/*  Message digest functions used for ring identity

    Modeled to meet the requirements of `Hasher` in the
    `hash_append` interface.
*/

/** SHA3-256 digest

    @note This uses the OpenSSL implementation
*/
struct openssl_sha3_256_hasher
{
public:
    using result_type = uint256;

    openssl_sha3_256_hasher();

    openssl_sha3_256_hasher(openssl_sha3_256_hasher const&) = delete;
    openssl_sha3_256_hasher&
    operator=(openssl_sha3_256_hasher const&) = delete;

    void
    operator()(void const* data, std::size_t size);

    explicit operator result_type();

private:
    struct ctx_deleter
    {
        void
        operator()(EVP_MD_CTX* ctx) const noexcept
        {
            EVP_MD_CTX_free(ctx);
        }
    };

    std::unique_ptr<EVP_MD_CTX, ctx_deleter> ctx_;
};

using sha3_256_hasher = openssl_sha3_256_hasher;

/** Returns the SHA3-256 digest of a buffer. */
uint256
sha3_256(void const* data, std::size_t size);

}  // namespace ringsettle

#endif
