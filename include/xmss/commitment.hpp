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

#include <xmss/statement.hpp>

namespace xmss {

/************************************************************
 * 32-byte binding of a statement, independent of node_width:
 *
 *   SHA256( le32(k) || le64(ep) || le32(|m|) || m
 *         || le32(|public_keys|) || root_0 || parameter_0 || ... )
 ************************************************************/
digest_t statement_commitment(const statement& stmt);

}  // namespace xmss
