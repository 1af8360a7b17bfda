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
#include <limits>
#include <sstream>

#include <boost/endian/conversion.hpp>

#include <xmss/codec.hpp>

namespace xmss::codec {

namespace {

constexpr size_t node_bytes = padded(node_width);

struct writer {
    void word(u32 x) {
        const size_t pos = out.size();
        out.resize(pos + word_size);
        boost::endian::store_little_u32(out.data() + pos, x);
    }

    void dword(u64 x) {
        word(static_cast<u32>(x));
        word(static_cast<u32>(x >> 32));
    }

    void raw(std::span<const u8> data) {
        out.insert(out.end(), data.begin(), data.end());
        out.resize(pos_padded());
    }

    void blob(std::span<const u8> data) {
        if (data.size() > std::numeric_limits<u32>::max())
            throw codec_error("Byte string too long to encode");
        word(static_cast<u32>(data.size()));
        raw(data);
    }

    void nodes(const std::vector<node_t>& v) {
        if (v.size() > std::numeric_limits<u32>::max())
            throw codec_error("Node vector too long to encode");
        word(static_cast<u32>(v.size()));
        for (const auto& n : v) raw(n);
    }

    size_t pos_padded() const { return padded(out.size()); }

    bytes out;
};

struct reader {
    explicit reader(std::span<const u8> data) : data_(data) { }

    size_t remaining() const { return data_.size() - pos_; }

    u32 word(const char *field) {
        need(word_size, field);
        const u32 x = boost::endian::load_little_u32(data_.data() + pos_);
        pos_ += word_size;
        return x;
    }

    u64 dword(const char *field) {
        const u64 lo = word(field);
        const u64 hi = word(field);
        return lo | (hi << 32);
    }

    u16 half(const char *field) {
        const u32 x = word(field);
        if (x > std::numeric_limits<u16>::max())
            fail(field, "value does not fit in 16 bits");
        return static_cast<u16>(x);
    }

    template <size_t N>
    void raw(std::array<u8, N>& out, const char *field) {
        need(padded(N), field);
        std::copy_n(data_.begin() + pos_, N, out.begin());
        check_padding(pos_ + N, pos_ + padded(N), field);
        pos_ += padded(N);
    }

    bytes blob(const char *field) {
        const u32 len = word(field);
        need(padded(len), field);
        bytes out(data_.begin() + pos_, data_.begin() + pos_ + len);
        check_padding(pos_ + len, pos_ + padded(len), field);
        pos_ += padded(len);
        return out;
    }

    /// Read an element count and make sure that many elements of at
    /// least `min_element_size` bytes can still follow.
    u32 count(size_t min_element_size, const char *field) {
        const u32 n = word(field);
        if (min_element_size != 0 && n > remaining() / min_element_size)
            fail(field, "count exceeds remaining input");
        return n;
    }

    std::vector<node_t> nodes(const char *field) {
        const u32 n = count(node_bytes, field);
        std::vector<node_t> out(n);
        for (auto& node : out) raw(node, field);
        return out;
    }

    void finish() const {
        if (pos_ != data_.size()) {
            std::stringstream ss;
            ss << remaining() << " trailing bytes after batch";
            throw codec_error(ss.str());
        }
    }

private:
    void need(size_t n, const char *field) const {
        if (n > remaining())
            fail(field, "truncated input");
    }

    void check_padding(size_t from, size_t to, const char *field) const {
        if (std::any_of(data_.begin() + from, data_.begin() + to, [](u8 b) { return b != 0; }))
            fail(field, "nonzero padding");
    }

    [[noreturn]] void fail(const char *field, const char *what) const {
        std::stringstream ss;
        ss << "Cannot decode " << field << " at offset " << pos_ << ": " << what;
        throw codec_error(ss.str());
    }

    std::span<const u8> data_;
    size_t pos_ = 0;
};

// Smallest encodings, used to bound element counts before allocation
constexpr size_t min_public_key_size = 2 * node_bytes;
constexpr size_t min_signature_size  = 4 * word_size;

}  // namespace


bytes encode_batch(const verification_batch& batch) {
    const auto& [p, stmt, wit] = batch;
    writer w;

    w.word(p.w);
    w.word(p.v);
    w.word(p.d0);
    w.word(p.security_bits);
    w.word(p.tree_height);

    w.word(stmt.k);
    w.dword(stmt.ep);
    w.blob(stmt.m);
    w.word(static_cast<u32>(stmt.public_keys.size()));
    for (const auto& pk : stmt.public_keys) {
        w.raw(pk.root);
        w.raw(pk.parameter);
    }

    w.word(static_cast<u32>(wit.signatures.size()));
    for (const auto& sig : wit.signatures) {
        w.word(sig.leaf_index);
        w.blob(sig.randomness);
        w.nodes(sig.chain_ends);
        w.nodes(sig.auth_path);
    }
    return std::move(w.out);
}

verification_batch decode_batch(std::span<const u8> data) {
    reader r(data);
    verification_batch batch;

    auto& p = batch.params;
    p.w             = r.half("params.w");
    p.v             = r.half("params.v");
    p.d0            = r.word("params.d0");
    p.security_bits = r.half("params.security_bits");
    p.tree_height   = r.half("params.tree_height");

    auto& stmt = batch.statement;
    stmt.k  = r.word("statement.k");
    stmt.ep = r.dword("statement.ep");
    stmt.m  = r.blob("statement.m");

    const u32 num_keys = r.count(min_public_key_size, "statement.public_keys");
    stmt.public_keys.resize(num_keys);
    for (auto& pk : stmt.public_keys) {
        r.raw(pk.root, "public_key.root");
        r.raw(pk.parameter, "public_key.parameter");
    }

    const u32 num_sigs = r.count(min_signature_size, "witness.signatures");
    batch.witness.signatures.resize(num_sigs);
    for (auto& sig : batch.witness.signatures) {
        sig.leaf_index = r.word("signature.leaf_index");
        sig.randomness = r.blob("signature.randomness");
        sig.chain_ends = r.nodes("signature.chain_ends");
        sig.auth_path  = r.nodes("signature.auth_path");
    }

    r.finish();
    return batch;
}

}  // namespace xmss::codec
