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
#include <gmpxx.h>

#include <xmss/types.hpp>

/// @file mpz.hpp
/// @brief Platform-safe conversions between GMP values and fixed-width integers

namespace xmss {

/// Build an mpz_class from a 128-bit value.
///
/// mpz_class has no 128-bit constructor and `unsigned long` may be
/// 32 bits wide, so the value is imported as two little-endian limbs.
inline mpz_class mpz_from_u128(u128 x) {
    const u64 limbs[2] = { static_cast<u64>(x), static_cast<u64>(x >> 64) };
    mpz_class out;
    mpz_import(out.get_mpz_t(), 2, -1, sizeof(u64), 0, 0, limbs);
    return out;
}

/// Extract a uint64_t, or nothing if the value is negative or needs
/// more than 64 bits.
inline std::optional<u64> mpz_to_u64(const mpz_class& val) {
    if (sgn(val) < 0 || mpz_sizeinbase(val.get_mpz_t(), 2) > 64)
        return std::nullopt;

    u64 result = 0;
    size_t count = 0;
    mpz_export(&result, &count, -1, sizeof(u64), 0, 0, val.get_mpz_t());
    return result;
}

}  // namespace xmss
