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
#include <new>
#include <stdexcept>

#include <boost/endian/conversion.hpp>

#include <xmss/encoding.hpp>
#include <xmss/hash.hpp>

namespace xmss {

namespace {

constexpr u128 u128_max = ~u128(0);

constexpr u128 saturating_add(u128 a, u128 b) {
    return (a > u128_max - b) ? u128_max : a + b;
}

/************************************************************
 * Counting table dp[rem][sum]: the number of ways to fill `rem`
 * coordinates in [0, w-1] so that they add up to `sum`.
 *
 * Rows are stored back to back, row `rem` starts at rem * (d0 + 1).
 ************************************************************/
struct layer_table {
    layer_table(u32 w, u32 v, u32 d0)
        : w_(w), v_(v), cols_(size_t(d0) + 1), dp_((size_t(v) + 1) * cols_, 0)
    {
        at(0, 0) = 1;
        for (u32 rem = 1; rem <= v_; rem++) {
            for (size_t s = 0; s < cols_; s++) {
                const size_t max_x = std::min<size_t>(w_ - 1, s);
                u128 acc = 0;
                for (size_t x = 0; x <= max_x; x++) {
                    acc = saturating_add(acc, at(rem - 1, s - x));
                }
                at(rem, s) = acc;
            }
        }
    }

    u128  at(size_t rem, size_t sum) const { return dp_[rem * cols_ + sum]; }
    u128& at(size_t rem, size_t sum)       { return dp_[rem * cols_ + sum]; }

    u128 size() const { return at(v_, cols_ - 1); }

private:
    u32 w_, v_;
    size_t cols_;
    std::vector<u128> dp_;
};

std::optional<mapping_error> check_layer(u32 w, u32 v, u32 d0) {
    if (v == 0 || w <= 1 || u64(d0) > u64(v) * (w - 1))
        return mapping_error::invalid_params;

    // Coordinates are emitted as u16
    if (w - 1 > std::numeric_limits<u16>::max())
        return mapping_error::invalid_params;

    return std::nullopt;
}

// The table has (v + 1) * (d0 + 1) entries; only the allocator bounds it
std::optional<layer_table> build_table(u32 w, u32 v, u32 d0) {
    try {
        return layer_table(w, v, d0);
    }
    catch (std::bad_alloc&) {
        return std::nullopt;
    }
    catch (std::length_error&) {
        return std::nullopt;
    }
}

}  // namespace


std::optional<u128> layer_size(u32 w, u32 v, u32 d0) {
    if (check_layer(w, v, d0))
        return std::nullopt;

    const auto dp = build_table(w, v, d0);
    if (!dp)
        return std::nullopt;
    return dp->size();
}

vertex_result integer_to_vertex(u64 index, u32 w, u32 v, u32 d0) {
    if (auto err = check_layer(w, v, d0))
        return *err;

    const auto table = build_table(w, v, d0);
    if (!table)
        return mapping_error::table_too_large;

    const layer_table& dp = *table;
    const u128 total = dp.size();
    if (total == 0)
        return mapping_error::invalid_params;

    u128 idx = u128(index) % total;

    vertex_t res;
    res.reserve(v);

    u32 sum = d0;
    for (u32 rem = v; rem > 0; rem--) {
        const u32 max_x = std::min(w - 1, sum);
        u32 chosen = 0;
        for (u32 x = 0; x <= max_x; x++) {
            const u128 count = dp.at(rem - 1, sum - x);
            if (idx < count) {
                chosen = x;
                break;
            }
            idx -= count;
        }
        res.push_back(static_cast<u16>(chosen));
        sum -= chosen;
    }
    return res;
}

vertex_result encode_vertex(std::span<const u8> domain,
                            std::span<const u8> randomness,
                            const params& p)
{
    sha256 h;
    const digest_t digest = h.update(domain).update(randomness).finalize();

    const u64 index = boost::endian::load_little_u64(digest.data());
    return integer_to_vertex(index, p.w, p.v, p.d0);
}

}  // namespace xmss
