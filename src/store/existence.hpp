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

// Warden Store - Referential existence checks

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "database.hpp"

namespace warden::store {

enum class Table {
    Users,
    Organizations,
    Events,
    Permissions
};

[[nodiscard]] std::string_view table_name(Table table) noexcept;

/// Verify every id exists in `table`. Fails with NotFound carrying the first
/// missing id in input order. An empty list succeeds without a query.
[[nodiscard]] Status ids_in_table(Database& db, Table table, const std::vector<std::string>& ids);

}  // namespace warden::store
