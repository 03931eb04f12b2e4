#include "hsync/persistence/backend.hpp"

namespace hsync::persistence {

Result<void> MemoryBackend::upsert(const std::string& table, const std::string& key, const nlohmann::json& row) {
    std::lock_guard lock(mutex_);
    tables_[table][key] = row;
    return Ok();
}

Result<void> MemoryBackend::erase(const std::string& table, const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = tables_.find(table);
    if (it != tables_.end()) {
        it->second.erase(key);
    }
    return Ok();
}

Result<std::map<std::string, nlohmann::json>> MemoryBackend::load(const std::string& table) {
    std::lock_guard lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Ok(std::map<std::string, nlohmann::json>{});
    }
    return Ok(it->second);
}

Result<void> MemoryBackend::compact(const std::string&) {
    return Ok();
}

std::size_t MemoryBackend::row_count(const std::string& table) const {
    std::lock_guard lock(mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

} // namespace hsync::persistence
