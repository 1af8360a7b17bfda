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

#include <span>
#include <stdexcept>
#include <string>

#include <xmss/statement.hpp>

/// @file codec.hpp
/// @brief Word-aligned little-endian encoding of a verification batch
///
/// Layout, every field padded to a multiple of 4 bytes:
///
///   params     w, v, d0, security_bits, tree_height    (one u32 word each)
///   statement  k, ep (two words), m, |pks|, (root, parameter)*
///   witness    |sigs|, (leaf_index, randomness, chain_ends, auth_path)*
///
/// Byte strings carry a u32 length word, node vectors a u32 count word,
/// and nodes are `node_width` raw bytes.

namespace xmss {

struct codec_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

namespace codec {

constexpr size_t word_size = 4;

constexpr size_t padded(size_t n) {
    return (n + word_size - 1) / word_size * word_size;
}

bytes encode_batch(const verification_batch& batch);

/// Decode a batch, rejecting truncated input, trailing bytes, nonzero
/// padding and any count larger than the bytes left to read.
///
/// @throws codec_error
verification_batch decode_batch(std::span<const u8> data);

}  // namespace codec

}  // namespace xmss
