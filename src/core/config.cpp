#include "hsync/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace hsync::core {
namespace {

using json = nlohmann::json;

template<typename T>
bool read_unsigned(const json& doc, const char* key, T& out, std::string& error) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<T>(value.get<long long>());
    return true;
}

bool read_string(const json& doc, const char* key, std::string& out, std::string& error) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = value.get<std::string>();
    return true;
}

} // namespace

Result<SyncConfig> parse_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<SyncConfig>(ErrorKind::Validation, "config is not a JSON object");
    }

    SyncConfig config;
    std::string error;
    std::string data_dir = config.data_dir.string();
    long long timeout_ms = config.cycle_timeout.count();
    long long interval_s = config.auto_sync_interval.count();
    long long retention_days = config.resolved_conflict_retention.count() / 24;

    const bool ok = read_string(doc, "device_id", config.device_id, error) &&
                    read_string(doc, "actor_id", config.actor_id, error) &&
                    read_string(doc, "endpoint", config.endpoint, error) &&
                    read_string(doc, "data_dir", data_dir, error) &&
                    read_string(doc, "log_level", config.log_level, error) &&
                    read_unsigned(doc, "cycle_timeout_ms", timeout_ms, error) &&
                    read_unsigned(doc, "auto_sync_interval_s", interval_s, error) &&
                    read_unsigned(doc, "max_retries", config.max_retries, error) &&
                    read_unsigned(doc, "max_changes_per_cycle", config.max_changes_per_cycle, error) &&
                    read_unsigned(doc, "resolved_conflict_retention_days", retention_days, error);
    if (!ok) {
        return Err<SyncConfig>(ErrorKind::Validation, error);
    }

    if (config.max_retries == 0) {
        return Err<SyncConfig>(ErrorKind::Validation, "'max_retries' must be at least 1");
    }
    if (config.device_id.empty()) {
        return Err<SyncConfig>(ErrorKind::Validation, "'device_id' must not be empty");
    }

    config.data_dir = data_dir;
    config.cycle_timeout = std::chrono::milliseconds(timeout_ms);
    config.auto_sync_interval = std::chrono::seconds(interval_s);
    config.resolved_conflict_retention = std::chrono::hours(retention_days * 24);
    return Ok(config);
}

Result<SyncConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(ErrorKind::NotFound, "cannot open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace hsync::core
