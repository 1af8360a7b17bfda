/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <algorithm>
#include <memory>
#include <span>
#include <stdexcept>

#include <openssl/evp.h>

#include <xmss/types.hpp>

namespace xmss {

/************************************************************
 * Incremental SHA-256 over OpenSSL EVP.
 *
 * The hasher is reusable: `finalize()` resets the context so the
 * next `update()` starts a fresh message.
 ************************************************************/
struct sha256 {
    using digest = digest_t;
    constexpr static size_t digest_size = xmss::digest_size;

    struct deleter { void operator()(EVP_MD_CTX *ctx) { EVP_MD_CTX_free(ctx); } };

    sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_)
            throw std::runtime_error("Failed to allocate SHA256 context");
        reset();
    }

    void reset() {
        if (1 != EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr))
            throw std::runtime_error("Cannot initialize SHA256 context");
    }

    sha256& update(const void *data, size_t len) {
        if (len != 0 && 1 != EVP_DigestUpdate(ctx_.get(), data, len))
            throw std::runtime_error("SHA256 update failed");
        return *this;
    }

    sha256& update(std::span<const u8> data) {
        return update(data.data(), data.size());
    }

    sha256& update(u8 byte) {
        return update(&byte, 1);
    }

    digest finalize() {
        digest out{};
        unsigned int len = 0;
        if (1 != EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) || len != digest_size)
            throw std::runtime_error("SHA256 finalize failed");
        reset();
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, deleter> ctx_;
};


/************************************************************
 * One-shot helpers used by the verification core.
 ************************************************************/
inline digest_t hash_bytes(std::span<const u8> data) {
    sha256 h;
    return h.update(data).finalize();
}

/// Hash into the node domain: the SHA-256 output truncated to `node_width`.
inline node_t truncate_node(const digest_t& d) {
    node_t out;
    std::copy_n(d.begin(), node_width, out.begin());
    return out;
}

inline node_t hash_node(std::span<const u8> data) {
    return truncate_node(hash_bytes(data));
}

}  // namespace xmss
