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

#include <xmss/types.hpp>

namespace xmss {

// Leading byte of every internal tree node preimage
constexpr u8 merkle_node_tag = 0x01;

/************************************************************
 * Compress two children into their parent.
 *
 *   H(0x01 || parameter || be32(height) || be32(parent_index) || left || right)
 *
 * @param parameter     Per-key public parameter
 * @param height        Height of the children (leaves are at 0)
 * @param parent_index  Index of the parent within its own level
 ************************************************************/
node_t merkle_node(const parameter_t& parameter, u32 height, u32 parent_index,
                   const node_t& left, const node_t& right);

/// Recompute the root from a leaf and its authentication path. The bits
/// of `leaf_index` select the sibling side at each height; an empty path
/// returns the leaf itself.
node_t merkle_root_from_path(const node_t& leaf, u64 leaf_index,
                             std::span<const node_t> auth_path,
                             const parameter_t& parameter);

}  // namespace xmss
