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

#include <xmss/commitment.hpp>
#include <xmss/hash.hpp>

namespace xmss {

namespace {

void update_le32(sha256& h, u32 x) {
    u8 buf[4];
    boost::endian::store_little_u32(buf, x);
    h.update(buf, sizeof(buf));
}

void update_le64(sha256& h, u64 x) {
    u8 buf[8];
    boost::endian::store_little_u64(buf, x);
    h.update(buf, sizeof(buf));
}

}  // namespace

digest_t statement_commitment(const statement& stmt) {
    sha256 h;
    update_le32(h, stmt.k);
    update_le64(h, stmt.ep);
    update_le32(h, static_cast<u32>(stmt.m.size()));
    h.update(stmt.m);
    update_le32(h, static_cast<u32>(stmt.public_keys.size()));
    for (const auto& pk : stmt.public_keys) {
        h.update(pk.root).update(pk.parameter);
    }
    return h.finalize();
}

}  // namespace xmss
