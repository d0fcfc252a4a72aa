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

// String Utilities - Field suggestions, header and cookie helpers

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::core {

/// Levenshtein edit distance (two-row dynamic programming)
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t len1 = s1.length();
    const size_t len2 = s2.length();

    if (len1 == 0)
        return len2;
    if (len2 == 0)
        return len1;

    std::vector<size_t> prev_row(len2 + 1);
    std::vector<size_t> curr_row(len2 + 1);

    for (size_t j = 0; j <= len2; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= len1; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= len2; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({prev_row[j], curr_row[j - 1], prev_row[j - 1]});
            }
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[len2];
}

/// Closest candidate within max_distance edits (used for "did you mean" hints
/// on unknown query fields and config keys)
[[nodiscard]] inline std::optional<std::string> closest_match(
    std::string_view target, const std::vector<std::string_view>& candidates,
    size_t max_distance = 3) {
    std::optional<std::string> best;
    size_t best_distance = max_distance + 1;

    for (const auto candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance > 0 && distance < best_distance) {
            best_distance = distance;
            best = std::string(candidate);
        }
    }

    return best;
}

/// Join strings with a delimiter
[[nodiscard]] inline std::string join(const std::vector<std::string>& strings,
                                      std::string_view delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::string result = strings[0];
    for (size_t i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

[[nodiscard]] inline std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

[[nodiscard]] inline std::string_view trim(std::string_view input) {
    while (!input.empty() && (input.front() == ' ' || input.front() == '\t')) {
        input.remove_prefix(1);
    }
    while (!input.empty() && (input.back() == ' ' || input.back() == '\t')) {
        input.remove_suffix(1);
    }
    return input;
}

/// Find a cookie value in a Cookie header ("a=1; authorization=xyz")
[[nodiscard]] inline std::optional<std::string_view> find_cookie(std::string_view cookie_header,
                                                                 std::string_view name) {
    while (!cookie_header.empty()) {
        size_t end = cookie_header.find(';');
        std::string_view pair = trim(cookie_header.substr(0, end));

        size_t eq = pair.find('=');
        if (eq != std::string_view::npos && trim(pair.substr(0, eq)) == name) {
            std::string_view value = trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }

        if (end == std::string_view::npos) {
            break;
        }
        cookie_header.remove_prefix(end + 1);
    }
    return std::nullopt;
}

/// Strip control characters and cap length before logging caller-supplied text
[[nodiscard]] inline std::string sanitize_for_logging(std::string_view input,
                                                      size_t max_length = 256) {
    std::string result;
    result.reserve(std::min(input.size(), max_length));

    for (char c : input) {
        if (result.size() >= max_length) {
            result += "...";
            break;
        }
        auto uc = static_cast<unsigned char>(c);
        result += (uc < 0x20 || uc == 0x7F) ? '?' : c;
    }
    return result;
}

}  // namespace warden::core
