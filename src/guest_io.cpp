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

#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>

#include <boost/algorithm/hex.hpp>
#include <boost/endian/conversion.hpp>
#include <nlohmann/json.hpp>

#include <xmss/codec.hpp>
#include <xmss/guest_io.hpp>
#include <xmss/util/log.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace xmss::guest_io {

namespace {

json read_json(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw codec_error("Could not open \"" + path.string() + "\"");
    }

    try {
        return json::parse(ifs);
    }
    catch (json::exception& e) {
        throw codec_error("Invalid JSON in \"" + path.string() + "\": " + e.what());
    }
}

void write_json(const fs::path& path, const json& j) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream ofs(path);
    if (!ofs) {
        throw codec_error("Could not write \"" + path.string() + "\"");
    }
    ofs << j.dump(2) << std::endl;
}

}  // namespace


output_words make_output_words(const batch_result& result, const digest_t& commitment) {
    output_words words{};
    words[valid_word] = result.all_valid ? 1u : 0u;
    words[count_word] = result.count;
    for (size_t i = 0; i < digest_size / 4; i++) {
        words[commitment_word + i] = boost::endian::load_little_u32(commitment.data() + 4 * i);
    }
    return words;
}

digest_t commitment_from_words(const output_words& words) {
    digest_t out{};
    for (size_t i = 0; i < digest_size / 4; i++) {
        boost::endian::store_little_u32(out.data() + 4 * i, words[commitment_word + i]);
    }
    return out;
}

std::string format_execution_output(const output_words& words) {
    std::stringstream ss;
    ss << "Execution output: [";
    for (size_t i = 0; i < words.size(); i++) {
        u8 le[4];
        boost::endian::store_little_u32(le, words[i]);
        for (size_t b = 0; b < 4; b++) {
            if (i + b != 0) ss << ", ";
            ss << static_cast<unsigned>(le[b]);
        }
    }
    ss << "]";
    return ss.str();
}

std::optional<output_words> parse_execution_output(std::string_view line) {
    const auto start = line.find('[');
    const auto end = line.rfind(']');
    if (start == std::string_view::npos || end == std::string_view::npos || end < start) {
        return std::nullopt;
    }

    bytes out;
    std::string_view body = line.substr(start + 1, end - start - 1);
    while (!body.empty()) {
        const auto comma = body.find(',');
        std::string_view part = body.substr(0, comma);
        body = comma == std::string_view::npos ? std::string_view{} : body.substr(comma + 1);

        while (!part.empty() && part.front() == ' ') part.remove_prefix(1);
        while (!part.empty() && part.back() == ' ') part.remove_suffix(1);
        if (part.empty()) continue;

        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size() || value > 0xff) {
            return std::nullopt;
        }
        out.push_back(static_cast<u8>(value));
    }

    if (out.size() < num_output_words * 4) {
        return std::nullopt;
    }

    output_words words{};
    for (size_t i = 0; i < words.size(); i++) {
        words[i] = boost::endian::load_little_u32(out.data() + 4 * i);
    }
    return words;
}

std::string to_hex(std::span<const u8> data) {
    std::string hex;
    hex.reserve(2 * data.size());
    boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(hex));
    return hex;
}

bytes read_input_file(const fs::path& path) {
    const json j = read_json(path);

    if (!j.contains("input") || !j["input"].is_array() || j["input"].empty() ||
        !j["input"][0].is_string())
    {
        throw codec_error("Expected { \"input\": [\"0x01...\"] } in \"" + path.string() + "\"");
    }

    std::string hex_str = j["input"][0].template get<std::string>();
    if (hex_str.starts_with("0x")) {
        hex_str = hex_str.substr(2);
    }

    bytes decoded;
    try {
        boost::algorithm::unhex(hex_str.begin(), hex_str.end(), std::back_inserter(decoded));
    }
    catch (boost::algorithm::hex_decode_error&) {
        throw codec_error("Malformed hex payload in \"" + path.string() + "\"");
    }

    if (decoded.empty() || decoded.front() != input_tag) {
        throw codec_error("Missing input tag byte in \"" + path.string() + "\"");
    }

    XMSS_LOG_DEBUG << "Read " << decoded.size() - 1 << " payload bytes from " << path;
    return bytes(decoded.begin() + 1, decoded.end());
}

void write_input_file(const fs::path& path, std::span<const u8> payload) {
    std::string hex = "0x";
    hex += to_hex(std::span<const u8>(&input_tag, 1));
    hex += to_hex(payload);

    json j;
    j["input"] = json::array({ hex });
    write_json(path, j);

    XMSS_LOG_INFO << "Wrote " << payload.size() << " payload bytes to " << path;
}

verification_batch read_batch(const fs::path& path) {
    return codec::decode_batch(read_input_file(path));
}

void write_batch(const fs::path& path, const verification_batch& batch) {
    write_input_file(path, codec::encode_batch(batch));
}

void write_output_file(const fs::path& path, const output_words& words) {
    json j;
    j["revealed"] = words;
    write_json(path, j);
}

output_words read_output_file(const fs::path& path) {
    const json j = read_json(path);

    if (!j.contains("revealed") || !j["revealed"].is_array() ||
        j["revealed"].size() != num_output_words)
    {
        throw codec_error("Expected ten revealed words in \"" + path.string() + "\"");
    }

    output_words words{};
    try {
        for (size_t i = 0; i < num_output_words; i++) {
            words[i] = j["revealed"][i].template get<u32>();
        }
    }
    catch (json::exception& e) {
        throw codec_error("Invalid revealed word in \"" + path.string() + "\": " + e.what());
    }
    return words;
}

}  // namespace xmss::guest_io
