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

#include <boost/endian/conversion.hpp>

#include <xmss/chain.hpp>
#include <xmss/merkle.hpp>
#include <xmss/verifier.hpp>

namespace xmss {

bytes signing_domain(std::span<const u8> message, u64 epoch, message_binding binding) {
    bytes domain;
    if (binding == message_binding::epoch_message) {
        domain.resize(sizeof(u64));
        boost::endian::store_little_u64(domain.data(), epoch);
    }
    domain.insert(domain.end(), message.begin(), message.end());
    return domain;
}

vertex_result message_steps(const params& p, const signature& sig,
                            std::span<const u8> message, u64 epoch,
                            message_binding binding)
{
    const bytes domain = signing_domain(message, epoch, binding);

    if (binding == message_binding::signature_randomness)
        return encode_vertex(domain, sig.randomness, p);

    const std::array<u8, params_limits::zero_randomness_size> zero_randomness{};
    return encode_vertex(domain, zero_randomness, p);
}

bool verify_one(const params& p, const signature& sig,
                std::span<const u8> message, u64 epoch,
                const public_key& pk, message_binding binding)
{
    if (p.w <= 1 || p.v == 0)
        return false;

    if (sig.chain_ends.size() != p.v || sig.auth_path.size() != p.tree_height)
        return false;

    const vertex_result steps = message_steps(p, sig, message, epoch, binding);
    if (!steps)
        return false;

    if (steps.value().size() != sig.chain_ends.size())
        return false;

    const node_t leaf = chain_leaf(p.w, steps.value(), sig.chain_ends);
    const node_t root = merkle_root_from_path(leaf, sig.leaf_index, sig.auth_path, pk.parameter);
    return root == pk.root;
}

batch_result verify_batch(const verification_batch& batch, message_binding binding) {
    const auto& [p, stmt, wit] = batch;
    const u32 k = stmt.k;

    if (stmt.public_keys.size() != k || wit.signatures.size() != k)
        return { false, 0 };

    batch_result result { true, 0 };
    for (u32 i = 0; i < k; i++) {
        const bool ok = verify_one(p, wit.signatures[i], stmt.m, stmt.ep,
                                   stmt.public_keys[i], binding);
        result.all_valid &= ok;
        result.count++;
    }
    return result;
}

}  // namespace xmss
