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

#include <boost/endian/conversion.hpp>

#include <xmss/hash.hpp>
#include <xmss/merkle.hpp>

namespace xmss {

namespace {

constexpr size_t preimage_size = 1 + node_width + 4 + 4 + 2 * node_width;

constexpr size_t height_offset = 1 + node_width;
constexpr size_t index_offset  = height_offset + 4;
constexpr size_t left_offset   = index_offset + 4;
constexpr size_t right_offset  = left_offset + node_width;

}  // namespace

node_t merkle_node(const parameter_t& parameter, u32 height, u32 parent_index,
                   const node_t& left, const node_t& right)
{
    std::array<u8, preimage_size> buf;
    buf[0] = merkle_node_tag;
    std::copy(parameter.begin(), parameter.end(), buf.begin() + 1);
    boost::endian::store_big_u32(buf.data() + height_offset, height);
    boost::endian::store_big_u32(buf.data() + index_offset, parent_index);
    std::copy(left.begin(), left.end(), buf.begin() + left_offset);
    std::copy(right.begin(), right.end(), buf.begin() + right_offset);
    return hash_node(buf);
}

node_t merkle_root_from_path(const node_t& leaf, u64 leaf_index,
                             std::span<const node_t> auth_path,
                             const parameter_t& parameter)
{
    node_t node = leaf;
    for (size_t h = 0; h < auth_path.size(); h++) {
        const node_t& sibling = auth_path[h];

        // Shifts past 63 would be undefined; every index bit above is zero
        const u64 bit    = h < 64 ? (leaf_index >> h) & 1 : 0;
        const u64 parent = h + 1 < 64 ? leaf_index >> (h + 1) : 0;

        node = bit == 0
            ? merkle_node(parameter, static_cast<u32>(h), static_cast<u32>(parent), node, sibling)
            : merkle_node(parameter, static_cast<u32>(h), static_cast<u32>(parent), sibling, node);
    }
    return node;
}

}  // namespace xmss
