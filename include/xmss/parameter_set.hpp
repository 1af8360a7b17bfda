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

#include <array>
#include <string>
#include <string_view>

#include <gmpxx.h>

#include <xmss/params.hpp>

namespace xmss {

/************************************************************
 * Named instantiations of the signature scheme.
 *
 * SHA256_H{height}_W{w}: SHA-256, tree height, Winternitz
 * parameter; lifetime is 2^height signatures.
 ************************************************************/
enum class parameter_set : u8 {
    sha256_h18_w4,
    sha256_h18_w8,
    sha256_h20_w4,
};

constexpr std::array<parameter_set, 3> all_parameter_sets = {
    parameter_set::sha256_h18_w4,
    parameter_set::sha256_h18_w8,
    parameter_set::sha256_h20_w4,
};

struct parameter_metadata {
    u32 lifetime = 0;
    u16 tree_height = 0;
    u16 winternitz_parameter = 0;
    std::string hash_function;
    size_t signature_size_bytes = 0;
    size_t public_key_size_bytes = 0;

    bool operator==(const parameter_metadata&) const = default;
};

// Message digest length, in bytes, that the encoding splits into chunks
constexpr u16 message_hash_len = 18;

// Bytes of per-signature randomness
constexpr size_t rand_len = 20;

std::string_view instantiation_type(parameter_set set);
parameter_metadata metadata(parameter_set set);

/// Encoding parameters for a set: v = message_hash_len * 8 / w and
/// d0 taken from the Winternitz checksum table.
params to_params(parameter_set set);

/// Checksum target d0 for a Winternitz parameter.
u32 checksum_target(u16 w);

/// Exact number of vertices in the layer (w, v, d0); zero when the
/// parameters are out of range.
mpz_class layer_size_exact(u32 w, u32 v, u32 d0);

}  // namespace xmss
