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

#include <vector>

#include <xmss/params.hpp>
#include <xmss/types.hpp>

namespace xmss {

struct public_key {
    node_t root{};
    parameter_t parameter{};

    bool operator==(const public_key&) const = default;
};

struct signature {
    u32 leaf_index = 0;
    bytes randomness;
    std::vector<node_t> chain_ends;   /**< one per chain, length v */
    std::vector<node_t> auth_path;    /**< one per level, length tree_height */

    bool operator==(const signature&) const = default;
};

/************************************************************
 * Public claim: `k` keys each signed message `m` at epoch `ep`.
 ************************************************************/
struct statement {
    u32 k = 0;
    u64 ep = 0;
    bytes m;
    std::vector<public_key> public_keys;

    bool operator==(const statement&) const = default;
};

struct witness {
    std::vector<signature> signatures;

    bool operator==(const witness&) const = default;
};

/// The sole unit of work handed to the guest.
struct verification_batch {
    xmss::params params;
    xmss::statement statement;
    xmss::witness witness;

    bool operator==(const verification_batch&) const = default;
};

}  // namespace xmss
