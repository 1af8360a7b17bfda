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

#include <algorithm>
#include <vector>

#include <xmss/parameter_set.hpp>

namespace xmss {

namespace {

// Hash output bytes per chain value and per tree node
constexpr size_t hash_len_w4 = 26;
constexpr size_t hash_len_w8 = 28;

size_t num_chains(u16 w) {
    return (message_hash_len * 8) / w;
}

size_t estimate_signature_size(u16 tree_height, u16 w, size_t hash_len) {
    return 4 + rand_len + num_chains(w) * hash_len + size_t(tree_height) * hash_len;
}

size_t estimate_public_key_size(u16 parameter_len, size_t hash_len) {
    return hash_len + parameter_len;
}

parameter_metadata make_metadata(u16 tree_height, u16 w, size_t hash_len) {
    return parameter_metadata {
        .lifetime              = u32(1) << tree_height,
        .tree_height           = tree_height,
        .winternitz_parameter  = w,
        .hash_function         = "SHA-256",
        .signature_size_bytes  = estimate_signature_size(tree_height, w, hash_len),
        .public_key_size_bytes = estimate_public_key_size(tree_height, hash_len),
    };
}

}  // namespace


std::string_view instantiation_type(parameter_set set) {
    switch (set) {
    case parameter_set::sha256_h18_w4: return "SIGWinternitzLifetime18W4";
    case parameter_set::sha256_h18_w8: return "SIGWinternitzLifetime18W8";
    case parameter_set::sha256_h20_w4: return "SIGWinternitzLifetime20W4";
    }
    return "unknown";
}

parameter_metadata metadata(parameter_set set) {
    switch (set) {
    case parameter_set::sha256_h18_w4: return make_metadata(18, 4, hash_len_w4);
    case parameter_set::sha256_h18_w8: return make_metadata(18, 8, hash_len_w8);
    case parameter_set::sha256_h20_w4: return make_metadata(20, 4, hash_len_w4);
    }
    return {};
}

u32 checksum_target(u16 w) {
    switch (w) {
    case 1: return 8;
    case 2: return 4;
    case 4: return 3;
    case 8: return 2;
    default: return 3;
    }
}

params to_params(parameter_set set) {
    const parameter_metadata meta = metadata(set);
    const u16 w = meta.winternitz_parameter;

    params p;
    p.w = w;
    p.v = static_cast<u16>(num_chains(w));
    p.d0 = checksum_target(w);
    p.security_bits = 128;
    p.tree_height = meta.tree_height;
    return p;
}

mpz_class layer_size_exact(u32 w, u32 v, u32 d0) {
    if (v == 0 || w <= 1 || u64(d0) > u64(v) * (w - 1))
        return 0;

    // Rolling single row: row[s] counts prefixes of the current length summing to s
    std::vector<mpz_class> row(size_t(d0) + 1, 0), next(size_t(d0) + 1);
    row[0] = 1;
    for (u32 rem = 1; rem <= v; rem++) {
        for (size_t s = 0; s <= d0; s++) {
            mpz_class acc = 0;
            const size_t max_x = std::min<size_t>(w - 1, s);
            for (size_t x = 0; x <= max_x; x++) {
                acc += row[s - x];
            }
            next[s] = acc;
        }
        std::swap(row, next);
    }
    return row[d0];
}

}  // namespace xmss
