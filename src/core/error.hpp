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

// Warden Errors - Header
// Error taxonomy shared by every module, plus Result/Status return types

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace warden::core {

/// Error category (what crosses the trust boundary is decided by the kind)
enum class ErrorKind {
    Unauthenticated,  // Missing/invalid credential (all token failures collapse here)
    Forbidden,        // Authenticated but lacking the required capability
    Validation,       // Malformed request (carries a field path)
    NotFound,         // Referenced id does not exist (carries the id)
    Store             // Internal persistence/crypto failure (logged, surfaced generically)
};

/// Reason attached to validation errors
enum class ValidationReason {
    EmptyField,
    TooManyItems,
    InvalidEnum,
    InvalidValue
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view validation_reason_to_string(ValidationReason reason) noexcept;

/// Error value
struct Error {
    ErrorKind kind = ErrorKind::Store;
    ValidationReason reason = ValidationReason::InvalidValue;
    std::string field;    // Validation: field path, NotFound: missing id
    std::string message;  // Internal detail (never sent to callers)

    [[nodiscard]] static Error unauthenticated(std::string detail = {});
    [[nodiscard]] static Error forbidden(std::string detail = {});
    [[nodiscard]] static Error validation(std::string field, ValidationReason reason,
                                          std::string detail = {});
    [[nodiscard]] static Error not_found(std::string id);
    [[nodiscard]] static Error store(std::string detail);

    /// Prefix the field path with a parent path segment.
    /// "user_id" with context "permissions[0]" becomes "permissions[0].user_id";
    /// "[1].name" with context "queries" becomes "queries[1].name".
    [[nodiscard]] Error with_context(std::string_view context) const;

    /// Message that may be returned to the caller
    [[nodiscard]] std::string public_message() const;

    /// Full description for logs
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }
};

/// Operation result carrying either a value or an Error
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    [[nodiscard]] static Result success(T value) { return Result(std::move(value)); }
    [[nodiscard]] static Result failure(Error error) { return Result(std::move(error)); }

    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }

    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    [[nodiscard]] T* operator->() { return &*value_; }
    [[nodiscard]] const T* operator->() const { return &*value_; }
    [[nodiscard]] T& operator*() & { return *value_; }
    [[nodiscard]] const T& operator*() const& { return *value_; }

    [[nodiscard]] const Error& error() const& { return error_; }
    [[nodiscard]] Error&& error() && { return std::move(error_); }

private:
    std::optional<T> value_;
    Error error_;
};

/// Result of an operation with no value
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    [[nodiscard]] static Status success() { return Status(); }
    [[nodiscard]] static Status failure(Error error) { return Status(std::move(error)); }

    [[nodiscard]] explicit operator bool() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] const Error& error() const& { return *error_; }
    [[nodiscard]] Error&& error() && { return std::move(*error_); }

private:
    std::optional<Error> error_;
};

}  // namespace warden::core
