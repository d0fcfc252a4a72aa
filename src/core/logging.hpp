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

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace warden::control {
struct LogConfig;
}

namespace warden::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger from config (rotating file sink, json or text)
quill::Logger* init_logger(const warden::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Process logger. Falls back to a console logger when init_logger() was never
// called, so library code can log unconditionally.
quill::Logger* get_logger();

// Correlation id for one call: {uuid v4}#{counter}
std::string generate_correlation_id();

// Validate a correlation id supplied by a caller ({uuid}#{counter})
bool is_valid_correlation_id(std::string_view id);

// Security audit line (key rotation, denied authorization)
#define LOG_AUDIT(logger, event, fmt_str, ...) \
    LOG_INFO(logger, "AUDIT {}: " fmt_str, event, ##__VA_ARGS__)

}  // namespace warden::logging
