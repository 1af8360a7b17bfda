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

#include <optional>
#include <span>
#include <variant>
#include <vector>

#include <xmss/params.hpp>
#include <xmss/types.hpp>

/// @file encoding.hpp
/// @brief Maps a digest onto a fixed-sum layer of the hypercube [0, w-1]^v

namespace xmss {

enum class mapping_error : u8 {
    invalid_params,   /**< v == 0, w <= 1, d0 out of range, or an empty layer */
    table_too_large,  /**< counting table could not be allocated */
};

using vertex_t = std::vector<u16>;

/************************************************************
 * Either an encoded vertex or the reason no vertex exists.
 ************************************************************/
struct vertex_result {
    vertex_result(vertex_t v) : data_(std::move(v)) { }
    vertex_result(mapping_error e) : data_(e) { }

    bool ok() const { return std::holds_alternative<vertex_t>(data_); }
    explicit operator bool() const { return ok(); }

    const vertex_t& value() const& { return std::get<vertex_t>(data_); }
    vertex_t&& value() &&          { return std::get<vertex_t>(std::move(data_)); }
    mapping_error error() const    { return std::get<mapping_error>(data_); }

private:
    std::variant<vertex_t, mapping_error> data_;
};


/// Number of vectors of length v with entries in [0, w-1] summing to d0,
/// saturated at 2^128 - 1. Empty when the parameters are rejected or the
/// counting table does not fit in memory.
std::optional<u128> layer_size(u32 w, u32 v, u32 d0);

/// Unrank the (index mod layer_size)-th vertex of the layer in
/// lexicographic order.
///
/// @param index  Any 64-bit index; it wraps around the layer size
/// @param w      Chain length, entries are < w
/// @param v      Vector length
/// @param d0     Required coordinate sum
vertex_result integer_to_vertex(u64 index, u32 w, u32 v, u32 d0);

/// Hash `domain || randomness`, read the first 8 digest bytes as a
/// little-endian index and unrank it within the layer given by `p`.
vertex_result encode_vertex(std::span<const u8> domain,
                            std::span<const u8> randomness,
                            const params& p);

}  // namespace xmss
