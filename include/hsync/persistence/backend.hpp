#pragma once

/**
 * @file backend.hpp
 * @brief Table-oriented persistence seam for the sync core
 *
 * The store, outbox, conflict store and metadata table all persist rows
 * through this interface. Each row is a JSON object addressed by
 * (table, key). Writes are upserts; erase removes a key.
 *
 * Two implementations ship:
 * - MemoryBackend: process-lifetime only (tests, ephemeral sessions)
 * - JournalBackend: one append-only JSON-lines file per table
 *
 * A backend that cannot make sense of what it reads reports
 * ErrorKind::StorageCorruption. It never skips rows silently.
 */

#include "hsync/core/result.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hsync::persistence {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual Result<void> upsert(const std::string& table, const std::string& key, const nlohmann::json& row) = 0;
    virtual Result<void> erase(const std::string& table, const std::string& key) = 0;

    /// Live rows of a table, keyed by row key.
    virtual Result<std::map<std::string, nlohmann::json>> load(const std::string& table) = 0;

    /// Drop superseded history for a table. No-op where there is none.
    virtual Result<void> compact(const std::string& table) = 0;
};

class MemoryBackend : public StorageBackend {
public:
    Result<void> upsert(const std::string& table, const std::string& key, const nlohmann::json& row) override;
    Result<void> erase(const std::string& table, const std::string& key) override;
    Result<std::map<std::string, nlohmann::json>> load(const std::string& table) override;
    Result<void> compact(const std::string& table) override;

    std::size_t row_count(const std::string& table) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, nlohmann::json>> tables_;
};

} // namespace hsync::persistence
