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

#include "logging.hpp"

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace warden::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};
static std::once_flag g_backend_started;

void init_logging_system() {
  std::call_once(g_backend_started, [] { quill::Backend::start(); });
}

static quill::LogLevel parse_level(std::string_view level) {
  std::string level_lower = core::to_lower(level);

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  } else if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  } else if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  init_logging_system();

  // "-" keeps the console logger (CLI use)
  if (log_config.output.empty() || log_config.output == "-") {
    auto* logger = get_logger();
    logger->set_log_level(parse_level(log_config.level));
    return logger;
  }

  std::error_code ec;
  std::filesystem::create_directories(log_config.output, ec);
  if (ec) {
    fprintf(stderr, "Cannot create log directory %s: %s\n", log_config.output.c_str(),
            ec.message().c_str());
  }

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000ULL);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  std::string log_path = fmt::format("{}/{}", log_config.output, log_config.file_name);

  quill::Logger* logger = nullptr;

  if (log_config.format == "json") {
    auto json_sink =
        quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger("warden", std::move(json_sink));
  } else {
    auto file_sink =
        quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger("warden", std::move(file_sink));
  }

  logger->set_log_level(parse_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  quill::Logger* logger = g_logger.load(std::memory_order_acquire);
  if (logger) {
    return logger;
  }

  init_logging_system();
  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("warden_console");
  logger = quill::Frontend::create_or_get_logger("warden_console", std::move(console_sink));

  // Another thread may have configured the real logger meanwhile; keep theirs
  quill::Logger* expected = nullptr;
  if (!g_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel)) {
    return expected;
  }
  return logger;
}

// Generate base UUID v4 (called once per thread)
static std::string generate_base_uuid() {
  std::mt19937 rng(std::random_device{}() ^
                   static_cast<uint32_t>(
                       std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 4) {
    uint32_t random_val = dist(rng);
    uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
    uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
    uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
    uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
  }

  // Version 4, RFC 4122 variant
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += fmt::format("{:02x}", uuid_bytes[i]);
  }
  return out;
}

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
  size_t hash_pos = id.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;
  }

  std::string_view uuid_part = id.substr(0, hash_pos);
  std::string_view counter_part = id.substr(hash_pos + 1);

  if (uuid_part.length() != 36) {
    return false;
  }

  if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
      uuid_part[23] != '-') {
    return false;
  }

  if (uuid_part[14] != '4') {
    return false;
  }

  char variant = uuid_part[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
      variant != 'A' && variant != 'B') {
    return false;
  }

  auto is_hex = [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  };

  for (size_t i = 0; i < 36; ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23)
      continue;
    if (!is_hex(uuid_part[i])) return false;
  }

  // Counter: 1..20 digits
  if (counter_part.empty() || counter_part.size() > 20) {
    return false;
  }

  for (char c : counter_part) {
    if (c < '0' || c > '9') {
      return false;
    }
  }

  return true;
}

}  // namespace warden::logging
