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
#include <stdexcept>
#include <string_view>

#include <boost/endian/conversion.hpp>

#include <xmss/chain.hpp>
#include <xmss/fixture.hpp>
#include <xmss/hash.hpp>
#include <xmss/merkle.hpp>
#include <xmss/verifier.hpp>

namespace xmss::fixture {

namespace {

constexpr std::string_view domain_tag = "xmss-fixture";

// Trees above this height take too long to build for a fixture
constexpr u16 max_fixture_height = 20;

enum fixture_label : u8 {
    label_parameter  = 'P',
    label_chain      = 'S',
    label_randomness = 'R',
};

std::vector<node_t> one_time_leaves(const params& p, u64 seed) {
    if (p.tree_height > max_fixture_height) {
        throw std::invalid_argument("Fixture tree height too large");
    }

    const u64 num_leaves = u64(1) << p.tree_height;
    const u32 top = p.w > 0 ? p.w - 1u : 0u;

    std::vector<node_t> leaves;
    leaves.reserve(num_leaves);
    for (u64 leaf = 0; leaf < num_leaves; leaf++) {
        sha256 h;
        for (u32 i = 0; i < p.v; i++) {
            h.update(advance_chain(derive_node(seed, label_chain, leaf, i), top));
        }
        leaves.push_back(truncate_node(h.finalize()));
    }
    return leaves;
}

}  // namespace


node_t derive_node(u64 seed, u8 label, u64 a, u64 b) {
    u8 buf[3 * sizeof(u64)];
    boost::endian::store_little_u64(buf, seed);
    boost::endian::store_little_u64(buf + 8, a);
    boost::endian::store_little_u64(buf + 16, b);

    sha256 h;
    h.update(domain_tag.data(), domain_tag.size()).update(label).update(buf, sizeof(buf));
    return truncate_node(h.finalize());
}


merkle_tree::merkle_tree(const parameter_t& parameter, std::vector<node_t> leaves) {
    if (leaves.empty() || (leaves.size() & (leaves.size() - 1)) != 0) {
        throw std::invalid_argument("Leaf count must be a nonzero power of two");
    }

    levels_.push_back(std::move(leaves));
    for (u32 h = 0; levels_.back().size() > 1; h++) {
        const auto& level = levels_.back();

        std::vector<node_t> parents;
        parents.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size() / 2; i++) {
            parents.push_back(merkle_node(parameter, h, static_cast<u32>(i),
                                          level[2 * i], level[2 * i + 1]));
        }
        levels_.push_back(std::move(parents));
    }
}

std::vector<node_t> merkle_tree::auth_path(u64 leaf_index) const {
    if (leaf_index >= levels_.front().size()) {
        throw std::out_of_range("Leaf index outside of tree");
    }

    std::vector<node_t> path;
    path.reserve(height());
    for (u32 h = 0; h < height(); h++) {
        path.push_back(levels_[h][(leaf_index >> h) ^ 1]);
    }
    return path;
}


key_material::key_material(const params& p, u64 seed)
    : params_(p),
      seed_(seed),
      tree_(derive_node(seed, label_parameter, 0, 0), one_time_leaves(p, seed)),
      pk_{ tree_.root(), derive_node(seed, label_parameter, 0, 0) }
{ }

std::vector<node_t> key_material::chain_starts(u32 leaf_index) const {
    std::vector<node_t> starts;
    starts.reserve(params_.v);
    for (u32 i = 0; i < params_.v; i++) {
        starts.push_back(derive_node(seed_, label_chain, leaf_index, i));
    }
    return starts;
}

signature key_material::sign(u32 leaf_index, std::span<const u8> message, u64 epoch,
                             message_binding binding, std::span<const u8> randomness) const
{
    signature sig;
    sig.leaf_index = leaf_index;
    if (randomness.empty()) {
        const node_t r = derive_node(seed_, label_randomness, leaf_index, epoch);
        sig.randomness.assign(r.begin(), r.end());
    }
    else {
        sig.randomness.assign(randomness.begin(), randomness.end());
    }

    const vertex_result steps = message_steps(params_, sig, message, epoch, binding);
    if (!steps) {
        throw std::invalid_argument(steps.error() == mapping_error::table_too_large
                                    ? "Encoding table does not fit in memory"
                                    : "Parameters admit no encoding");
    }

    const auto starts = chain_starts(leaf_index);
    sig.chain_ends.reserve(starts.size());
    for (size_t i = 0; i < starts.size(); i++) {
        sig.chain_ends.push_back(advance_chain(starts[i], steps.value()[i]));
    }
    sig.auth_path = tree_.auth_path(leaf_index);
    return sig;
}


verification_batch make_batch(const params& p, u32 num_signatures,
                              std::span<const u8> message, u64 epoch,
                              u64 first_seed, message_binding binding)
{
    verification_batch batch;
    batch.params = p;
    batch.statement.k = num_signatures;
    batch.statement.ep = epoch;
    batch.statement.m.assign(message.begin(), message.end());

    const u64 num_leaves = u64(1) << std::min<u16>(p.tree_height, max_fixture_height);
    for (u32 i = 0; i < num_signatures; i++) {
        const key_material key(p, first_seed + i);
        batch.statement.public_keys.push_back(key.pk());
        batch.witness.signatures.push_back(
            key.sign(static_cast<u32>(i % num_leaves), message, epoch, binding));
    }
    return batch;
}

verification_batch make_failing_batch() {
    verification_batch batch;
    batch.params = params{ .w = 4, .v = 4, .d0 = 4, .security_bits = 128, .tree_height = 0 };

    const std::string_view msg = "test message";
    batch.statement.k = 1;
    batch.statement.ep = 0;
    batch.statement.m.assign(msg.begin(), msg.end());

    public_key pk;
    pk.root.fill(1);
    pk.parameter.fill(2);
    batch.statement.public_keys.push_back(pk);

    signature sig;
    sig.randomness.assign(32, 0);
    sig.chain_ends.assign(batch.params.v, node_t{});
    batch.witness.signatures.push_back(std::move(sig));
    return batch;
}

}  // namespace xmss::fixture
