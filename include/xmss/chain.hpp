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

/// Apply the node hash `count` times starting from `start`.
node_t advance_chain(const node_t& start, u32 count);

/************************************************************
 * Walk every chain to its top position and compress the tops
 * into a tree leaf.
 *
 * Chain i is advanced (w - 1 - steps[i]) times, clamped at zero,
 * and the leaf is H(top_0 || top_1 || ... || top_{v-1}).
 *
 * Callers check that steps and chain_ends have the same length.
 *
 * @param w           Chain length
 * @param steps       Encoded vertex, one position per chain
 * @param chain_ends  Chain values revealed by the signature
 * @return  The reconstructed leaf
 ************************************************************/
node_t chain_leaf(u32 w, std::span<const u16> steps, std::span<const node_t> chain_ends);

}  // namespace xmss
