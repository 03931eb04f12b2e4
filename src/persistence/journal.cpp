#include "hsync/persistence/journal.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace hsync::persistence {
namespace fs = std::filesystem;
using json = nlohmann::json;

JournalBackend::JournalBackend(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        spdlog::error("[Journal] cannot create {}: {}", root_.string(), ec.message());
    }
}

JournalBackend::~JournalBackend() {
    std::lock_guard lock(mutex_);
    for (auto& [table, stream] : streams_) {
        stream->flush();
    }
}

fs::path JournalBackend::table_path(const std::string& table) const {
    return root_ / (table + ".jsonl");
}

std::ofstream& JournalBackend::stream_for(const std::string& table) {
    auto it = streams_.find(table);
    if (it == streams_.end()) {
        auto stream = std::make_unique<std::ofstream>(table_path(table), std::ios::binary | std::ios::app);
        it = streams_.emplace(table, std::move(stream)).first;
    }
    return *it->second;
}

Result<void> JournalBackend::append(const std::string& table, const json& line) {
    auto& out = stream_for(table);
    if (!out) {
        return Err<void>(core::storage_corruption("journal not writable: " + table_path(table).string()));
    }
    out << line.dump() << '\n';
    out.flush();
    if (!out) {
        return Err<void>(core::storage_corruption("journal write failed: " + table_path(table).string()));
    }
    return Ok();
}

Result<void> JournalBackend::upsert(const std::string& table, const std::string& key, const json& row) {
    std::lock_guard lock(mutex_);
    return append(table, json{{"op", "put"}, {"key", key}, {"row", row}});
}

Result<void> JournalBackend::erase(const std::string& table, const std::string& key) {
    std::lock_guard lock(mutex_);
    return append(table, json{{"op", "del"}, {"key", key}});
}

Result<std::map<std::string, json>> JournalBackend::replay(const std::string& table) const {
    using Rows = std::map<std::string, json>;
    const auto path = table_path(table);
    Rows rows;
    if (!fs::exists(path)) {
        return Ok(rows);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<Rows>(core::storage_corruption("cannot open journal: " + path.string()));
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        const bool last_line_torn = input.eof();
        auto entry = json::parse(line, nullptr, false);
        const bool well_formed = !entry.is_discarded() && entry.is_object() &&
                                 entry.contains("op") && entry.at("op").is_string() &&
                                 entry.contains("key") && entry.at("key").is_string();
        if (!well_formed) {
            if (last_line_torn) {
                spdlog::warn("[Journal] discarding torn tail of {} at line {}", path.string(), line_number);
                break;
            }
            return Err<Rows>(core::storage_corruption(
                "malformed journal line " + std::to_string(line_number) + " in " + path.string()));
        }

        const auto op = entry.at("op").get<std::string>();
        const auto key = entry.at("key").get<std::string>();
        if (op == "put" && entry.contains("row")) {
            rows[key] = entry.at("row");
        } else if (op == "del") {
            rows.erase(key);
        } else {
            return Err<Rows>(core::storage_corruption(
                "unknown journal op '" + op + "' at line " + std::to_string(line_number) + " in " + path.string()));
        }
    }
    return Ok(rows);
}

Result<std::map<std::string, json>> JournalBackend::load(const std::string& table) {
    std::lock_guard lock(mutex_);
    auto it = streams_.find(table);
    if (it != streams_.end()) {
        it->second->flush();
    }
    return replay(table);
}

Result<void> JournalBackend::compact(const std::string& table) {
    std::lock_guard lock(mutex_);
    auto stream_it = streams_.find(table);
    if (stream_it != streams_.end()) {
        stream_it->second->flush();
    }

    auto rows = replay(table);
    if (rows.is_error()) {
        return Err<void>(rows.error());
    }

    const auto path = table_path(table);
    const auto temp_path = fs::path(path.string() + ".compact");
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(core::storage_corruption("cannot write " + temp_path.string()));
        }
        for (const auto& [key, row] : rows.value()) {
            out << json{{"op", "put"}, {"key", key}, {"row", row}}.dump() << '\n';
        }
        out.flush();
        if (!out) {
            return Err<void>(core::storage_corruption("short write to " + temp_path.string()));
        }
    }

    // Close the append stream before swapping files underneath it
    if (stream_it != streams_.end()) {
        streams_.erase(stream_it);
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        return Err<void>(core::storage_corruption("compaction rename failed: " + ec.message()));
    }
    spdlog::debug("[Journal] compacted {} to {} rows", table, rows.value().size());
    return Ok();
}

} // namespace hsync::persistence
