/*
 * Copyright 2025 Warden Contributors
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

// Warden Containers
// Hash containers used for call metadata, key caches and permission filtering

#pragma once

#include <ankerl/unordered_dense.h>

namespace warden::core {

// ankerl::unordered_dense keeps entries in a contiguous vector, so iteration
// is cheap and iterators are invalidated on insertion (like std::vector).
//
// Usage:
//   warden::core::fast_map<std::string, std::string> headers;
//   warden::core::fast_set<std::string> seen_emails;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace warden::core
