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
#include <vector>

#include <xmss/statement.hpp>

/// @file fixture.hpp
/// @brief Deterministic witness construction for tests and input generation
///
/// Nothing here is used by the verifier. Keys are derived from a seed
/// by hashing, so fixtures are reproducible and carry no secrets.

namespace xmss::fixture {

/************************************************************
 * Full binary tree over 2^height leaves using the same node
 * compression as the verifier.
 ************************************************************/
struct merkle_tree {
    merkle_tree(const parameter_t& parameter, std::vector<node_t> leaves);

    const node_t& root() const { return levels_.back().front(); }
    u32 height() const { return static_cast<u32>(levels_.size() - 1); }

    std::vector<node_t> auth_path(u64 leaf_index) const;

private:
    std::vector<std::vector<node_t>> levels_;   /**< levels_[0] are the leaves */
};

/************************************************************
 * One deterministic key: a public parameter, 2^tree_height
 * one-time leaves and the tree over them.
 ************************************************************/
struct key_material {
    key_material(const params& p, u64 seed);

    const public_key& pk() const { return pk_; }

    const merkle_tree& tree() const { return tree_; }

    /// Chain starting values of the one-time key at `leaf_index`.
    std::vector<node_t> chain_starts(u32 leaf_index) const;

    /// Produce a signature at `leaf_index` over (message, epoch) that
    /// verifies under `binding`.
    ///
    /// @throws std::invalid_argument when the parameters admit no encoding
    signature sign(u32 leaf_index, std::span<const u8> message, u64 epoch,
                   message_binding binding = message_binding::epoch_message,
                   std::span<const u8> randomness = {}) const;

private:
    params params_;
    u64 seed_;
    merkle_tree tree_;
    public_key pk_;
};

/// Node derived from (seed, label, a, b); used for every fixture secret.
node_t derive_node(u64 seed, u8 label, u64 a, u64 b);

/// Build a batch of `num_signatures` valid signatures, one key each,
/// over the same (message, epoch). Key i uses seed `first_seed + i` and
/// signs at leaf `i mod 2^tree_height`. Throws like `key_material::sign`.
verification_batch make_batch(const params& p, u32 num_signatures,
                              std::span<const u8> message, u64 epoch,
                              u64 first_seed = 1,
                              message_binding binding = message_binding::epoch_message);

/// One-signature batch that fails verification: w=4, v=4, d0=4,
/// tree_height=0, all-zero chain ends against an unrelated root.
verification_batch make_failing_batch();

}  // namespace xmss::fixture
