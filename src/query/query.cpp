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

// Warden Query Engine - Implementation

#include "query.hpp"

#include "../core/string_utils.hpp"
#include "wire.hpp"

namespace warden::query {

std::string_view logical_operator_sql(LogicalOperator op) noexcept {
    switch (op) {
        case LogicalOperator::Equals:
            return "=";
        case LogicalOperator::NotEquals:
            return "!=";
    }
    return "=";
}

std::string_view compound_operator_sql(CompoundOperator op) noexcept {
    switch (op) {
        case CompoundOperator::And:
            return "AND";
        case CompoundOperator::Or:
            return "OR";
    }
    return "AND";
}

// ============================================================================
// Wire helpers
// ============================================================================

core::Result<LogicalOperator> parse_logical_operator(std::string_view value) {
    if (value == "EQUALS") {
        return LogicalOperator::Equals;
    } else if (value == "NOT_EQUALS") {
        return LogicalOperator::NotEquals;
    }
    return core::Error::validation("operator", core::ValidationReason::InvalidEnum);
}

core::Result<CompoundOperator> parse_compound_operator(std::string_view value) {
    if (value == "AND") {
        return CompoundOperator::And;
    } else if (value == "OR") {
        return CompoundOperator::Or;
    }
    return core::Error::validation("operator", core::ValidationReason::InvalidEnum);
}

core::Error unknown_field(std::string_view field, const std::vector<std::string_view>& known) {
    std::string detail = "unknown field '" + core::sanitize_for_logging(field, 64) + "'";
    if (auto suggestion = core::closest_match(field, known)) {
        detail += " (did you mean '" + *suggestion + "'?)";
    }
    return core::Error::validation("field", core::ValidationReason::InvalidValue,
                                   std::move(detail));
}

core::Result<std::string> expect_string(const nlohmann::json& value, bool allow_empty) {
    if (!value.is_string()) {
        return core::Error::validation("value", core::ValidationReason::InvalidValue,
                                       "expected a string");
    }

    auto str = value.get<std::string>();
    if (str.empty() && !allow_empty) {
        return core::Error::validation("value", core::ValidationReason::EmptyField);
    }
    return str;
}

}  // namespace warden::query
