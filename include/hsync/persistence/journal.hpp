#pragma once

#include "hsync/persistence/backend.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hsync::persistence {

/**
 * @brief Append-only JSON-lines persistence, one file per table
 *
 * File layout: <root>/<table>.jsonl, one operation per line:
 *   {"op":"put","key":"t1","row":{...}}
 *   {"op":"del","key":"t1"}
 *
 * load() replays the file, last write per key wins. compact() rewrites the
 * file with only the live rows through a temporary file and a rename, so a
 * crash mid-compaction leaves either the old or the new file intact.
 *
 * A line that does not parse is StorageCorruption for that table. The only
 * exception is a torn final line (no trailing newline), which is what an
 * interrupted append leaves behind; it is discarded with a warning.
 */
class JournalBackend : public StorageBackend {
public:
    explicit JournalBackend(std::filesystem::path root);
    ~JournalBackend() override;

    JournalBackend(const JournalBackend&) = delete;
    JournalBackend& operator=(const JournalBackend&) = delete;

    Result<void> upsert(const std::string& table, const std::string& key, const nlohmann::json& row) override;
    Result<void> erase(const std::string& table, const std::string& key) override;
    Result<std::map<std::string, nlohmann::json>> load(const std::string& table) override;
    Result<void> compact(const std::string& table) override;

    std::filesystem::path table_path(const std::string& table) const;

private:
    Result<void> append(const std::string& table, const nlohmann::json& line);
    Result<std::map<std::string, nlohmann::json>> replay(const std::string& table) const;
    std::ofstream& stream_for(const std::string& table);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<std::ofstream>> streams_;
};

} // namespace hsync::persistence
