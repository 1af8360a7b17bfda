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

#include <xmss/chain.hpp>
#include <xmss/hash.hpp>

namespace xmss {

node_t advance_chain(const node_t& start, u32 count) {
    sha256 h;
    node_t val = start;
    for (u32 i = 0; i < count; i++) {
        val = truncate_node(h.update(val).finalize());
    }
    return val;
}

node_t chain_leaf(u32 w, std::span<const u16> steps, std::span<const node_t> chain_ends) {
    const size_t n = std::min(steps.size(), chain_ends.size());
    const u32 top = w > 0 ? w - 1 : 0;

    sha256 leaf_hash;
    for (size_t i = 0; i < n; i++) {
        const u32 remaining = steps[i] >= top ? 0 : top - steps[i];
        leaf_hash.update(advance_chain(chain_ends[i], remaining));
    }
    return truncate_node(leaf_hash.finalize());
}

}  // namespace xmss
