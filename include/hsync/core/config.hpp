#pragma once

#include "hsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace hsync::core {

/**
 * @brief Runtime settings for one device's sync engine
 *
 * Example file:
 * {
 *   "device_id": "kitchen-tablet",
 *   "actor_id": "parent-1",
 *   "endpoint": "http://127.0.0.1:8080",
 *   "data_dir": "./hsync_data",
 *   "cycle_timeout_ms": 30000,
 *   "auto_sync_interval_s": 300,
 *   "max_retries": 5,
 *   "max_changes_per_cycle": 0,
 *   "resolved_conflict_retention_days": 7,
 *   "log_level": "info"
 * }
 */
struct SyncConfig {
    std::string device_id = "device-local";
    std::string actor_id = "local-user";
    std::string endpoint;
    std::filesystem::path data_dir = "hsync_data";
    std::chrono::milliseconds cycle_timeout{30000};
    std::chrono::seconds auto_sync_interval{300};
    std::size_t max_retries = 5;
    std::size_t max_changes_per_cycle = 0;   ///< 0 means no cap
    std::chrono::hours resolved_conflict_retention{24 * 7};
    std::string log_level = "info";
};

/// Parse settings from JSON text. Missing keys keep their defaults.
Result<SyncConfig> parse_config(const std::string& json_text);

/// Read and parse a JSON settings file.
Result<SyncConfig> load_config(const std::filesystem::path& path);

} // namespace hsync::core
