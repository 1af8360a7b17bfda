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

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#ifndef XMSS_NODE_WIDTH
#define XMSS_NODE_WIDTH 32
#endif

namespace xmss {

// Numeric Types
/* ------------------------------------------------------------ */
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

__extension__ using u128 = unsigned __int128;

// Hash-domain elements
/* ------------------------------------------------------------ */
constexpr size_t digest_size = 32;
constexpr size_t node_width  = XMSS_NODE_WIDTH;

static_assert(node_width > 0 && node_width <= digest_size,
              "XMSS_NODE_WIDTH must be in [1, 32]");

using bytes       = std::vector<u8>;
using digest_t    = std::array<u8, digest_size>;
using node_t      = std::array<u8, node_width>;
using parameter_t = std::array<u8, node_width>;

}  // namespace xmss
