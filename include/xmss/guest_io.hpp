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
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <xmss/verifier.hpp>

namespace xmss::guest_io {

// Tag byte that prefixes the hex payload of an input file
constexpr u8 input_tag = 0x01;

constexpr size_t num_output_words = 10;
constexpr size_t valid_word       = 0;
constexpr size_t count_word       = 1;
constexpr size_t commitment_word  = 2;

using output_words = std::array<u32, num_output_words>;

/************************************************************
 * Public outputs in their fixed positions:
 *
 *   [0]     all_valid as 0/1
 *   [1]     count
 *   [2..9]  statement commitment, eight little-endian words
 ************************************************************/
output_words make_output_words(const batch_result& result, const digest_t& commitment);

digest_t commitment_from_words(const output_words& words);

/// Render as the 40 revealed bytes: "Execution output: [b0, b1, ...]"
std::string format_execution_output(const output_words& words);

/// Recover the words from a line printed by `format_execution_output`.
std::optional<output_words> parse_execution_output(std::string_view line);


/************************************************************
 * Input files hold one hex string, the tag byte followed by the
 * encoded batch:  { "input": ["0x01<hex>"] }
 *
 * @throws codec_error on malformed JSON, hex or tag
 ************************************************************/
bytes read_input_file(const std::filesystem::path& path);
void write_input_file(const std::filesystem::path& path, std::span<const u8> payload);

verification_batch read_batch(const std::filesystem::path& path);
void write_batch(const std::filesystem::path& path, const verification_batch& batch);

/// Revealed words are stored as { "revealed": [w0, ..., w9] }
void write_output_file(const std::filesystem::path& path, const output_words& words);
output_words read_output_file(const std::filesystem::path& path);

std::string to_hex(std::span<const u8> data);

}  // namespace xmss::guest_io
