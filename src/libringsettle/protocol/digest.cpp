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

#include <ringsettle/basics/contract.h>
#include <ringsettle/protocol/digest.h>

#include <new>
#include <stdexcept>

namespace ringsettle {

openssl_sha3_256_hasher::openssl_sha3_256_hasher() : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_)
        Throw<std::bad_alloc>();

    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha3_256(), nullptr) != 1)
        Throw<std::runtime_error>("sha3_256: digest init failed");
}

void
openssl_sha3_256_hasher::operator()(void const* data, std::size_t size)
{
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
        Throw<std::runtime_error>("sha3_256: digest update failed");
}

openssl_sha3_256_hasher::operator result_type()
{
    result_type digest;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 ||
        len != result_type::bytes)
        Throw<std::runtime_error>("sha3_256: digest final failed");
    return digest;
}

uint256
sha3_256(void const* data, std::size_t size)
{
    sha3_256_hasher h;
    h(data, size);
    return static_cast<sha3_256_hasher::result_type>(h);
}

}  // namespace ringsettle
