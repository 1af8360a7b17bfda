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

#include <xmss/encoding.hpp>
#include <xmss/statement.hpp>

/// @file verifier.hpp
/// @brief Batch verification of hash-based signatures
///
/// Every function here is total: malformed witness data, shape
/// mismatches and bad parameters all come back as a rejection.

namespace xmss {

struct batch_result {
    bool all_valid = false;
    u32 count = 0;   /**< signatures processed, not signatures accepted */

    bool operator==(const batch_result&) const = default;
};

/// Bytes the encoded vertex of a signature is derived from, under the
/// chosen binding. `signature_randomness` returns the message unchanged.
bytes signing_domain(std::span<const u8> message, u64 epoch, message_binding binding);

/// Derive the chain positions a signature over (message, epoch) must open.
vertex_result message_steps(const params& p, const signature& sig,
                            std::span<const u8> message, u64 epoch,
                            message_binding binding = message_binding::epoch_message);

/************************************************************
 * Verify a single signature against one public key.
 *
 * @param p        Batch parameters
 * @param sig      Witness signature
 * @param message  Signed message
 * @param epoch    Signing epoch
 * @param pk       Claimed public key
 * @param binding  Which bytes the vertex is derived from
 * @return  true iff the reconstructed root equals pk.root
 ************************************************************/
bool verify_one(const params& p, const signature& sig,
                std::span<const u8> message, u64 epoch,
                const public_key& pk,
                message_binding binding = message_binding::epoch_message);

/************************************************************
 * Verify all `statement.k` signatures of a batch.
 *
 * A key or signature count different from k rejects the whole
 * batch with (false, 0) before any signature is looked at.
 ************************************************************/
batch_result verify_batch(const verification_batch& batch,
                          message_binding binding = message_binding::epoch_message);

}  // namespace xmss
