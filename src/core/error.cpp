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

// Warden Errors - Implementation

#include "error.hpp"

#include <fmt/format.h>

namespace warden::core {

std::string_view error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Unauthenticated:
            return "unauthenticated";
        case ErrorKind::Forbidden:
            return "forbidden";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Store:
            return "store";
    }
    return "unknown";
}

std::string_view validation_reason_to_string(ValidationReason reason) noexcept {
    switch (reason) {
        case ValidationReason::EmptyField:
            return "cannot be empty";
        case ValidationReason::TooManyItems:
            return "contains too many items";
        case ValidationReason::InvalidEnum:
            return "contains invalid enum value";
        case ValidationReason::InvalidValue:
            return "contains an invalid value";
    }
    return "is invalid";
}

Error Error::unauthenticated(std::string detail) {
    Error e;
    e.kind = ErrorKind::Unauthenticated;
    e.message = std::move(detail);
    return e;
}

Error Error::forbidden(std::string detail) {
    Error e;
    e.kind = ErrorKind::Forbidden;
    e.message = std::move(detail);
    return e;
}

Error Error::validation(std::string field, ValidationReason reason, std::string detail) {
    Error e;
    e.kind = ErrorKind::Validation;
    e.reason = reason;
    e.field = std::move(field);
    e.message = std::move(detail);
    return e;
}

Error Error::not_found(std::string id) {
    Error e;
    e.kind = ErrorKind::NotFound;
    e.field = std::move(id);
    return e;
}

Error Error::store(std::string detail) {
    Error e;
    e.kind = ErrorKind::Store;
    e.message = std::move(detail);
    return e;
}

Error Error::with_context(std::string_view context) const {
    Error e = *this;
    if (kind != ErrorKind::Validation) {
        return e;
    }

    if (field.empty() || field.front() == '[') {
        e.field = fmt::format("{}{}", context, field);
    } else {
        e.field = fmt::format("{}.{}", context, field);
    }
    return e;
}

std::string Error::public_message() const {
    switch (kind) {
        case ErrorKind::Unauthenticated:
            return "unauthenticated";
        case ErrorKind::Forbidden:
            return "permission denied";
        case ErrorKind::Validation:
            return fmt::format("{} {}", field, validation_reason_to_string(reason));
        case ErrorKind::NotFound:
            return fmt::format("id {} does not exist", field);
        case ErrorKind::Store:
            return "internal error";
    }
    return "internal error";
}

std::string Error::describe() const {
    if (message.empty()) {
        return fmt::format("{}: {}", error_kind_to_string(kind), public_message());
    }
    return fmt::format("{}: {} ({})", error_kind_to_string(kind), public_message(), message);
}

}  // namespace warden::core
