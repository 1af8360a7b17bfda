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
#include <string_view>

#include <xmss/types.hpp>

namespace xmss {

/************************************************************
 * Encoding and tree parameters shared by every signature of a
 * batch.
 *
 * w              chain length (coordinates live in [0, w-1])
 * v              number of chains
 * d0             target coordinate sum of an encoded vertex
 * security_bits  informational, not used by verification
 * tree_height    expected authentication path length
 ************************************************************/
struct params {
    u16 w = 0;
    u16 v = 0;
    u32 d0 = 0;
    u16 security_bits = 0;
    u16 tree_height = 0;

    bool operator==(const params&) const = default;

    bool valid() const {
        return w > 1 && v >= 1 &&
            static_cast<u64>(d0) <= static_cast<u64>(v) * (w - 1u);
    }
};


namespace params_limits {

// Size of the zero randomness used by `message_binding::epoch_message`
constexpr size_t zero_randomness_size = 32;

}  // namespace params_limits


/************************************************************
 * Which bytes a signature's encoded vertex is derived from.
 *
 * epoch_message         H(le64(epoch) || m || 32 zero bytes)
 * signature_randomness  H(m || signature.randomness)
 ************************************************************/
enum class message_binding : u8 {
    epoch_message,
    signature_randomness,
};

constexpr std::string_view binding_name(message_binding b) {
    switch (b) {
    case message_binding::epoch_message:        return "epoch-message";
    case message_binding::signature_randomness: return "signature-randomness";
    }
    return "unknown";
}

inline std::optional<message_binding> parse_binding(std::string_view name) {
    if (name == "epoch-message")        return message_binding::epoch_message;
    if (name == "signature-randomness") return message_binding::signature_randomness;
    return std::nullopt;
}

}  // namespace xmss
