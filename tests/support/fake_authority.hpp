#pragma once

#include "hsync/core/clock.hpp"
#include "hsync/sync/protocol.hpp"
#include "hsync/sync/transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hsync::testing {

/**
 * @brief In-process remote authority for sync tests
 *
 * Keeps one row per (collection, id) and applies the usual optimistic
 * version check: a pushed change is accepted when its version is newer than
 * the stored one (or identical in content), otherwise it is reported back as
 * a conflict. Server changes are every row touched after the client's
 * lastSyncTimestamp, except the ones the same request just wrote.
 */
class FakeAuthority : public sync::Transport {
public:
    struct Row {
        store::Collection collection = store::Collection::Tasks;
        std::string id;
        std::uint64_t version = 0;
        nlohmann::json data = nlohmann::json::object();
        core::Timestamp updated_at{};
        bool deleted = false;
        std::string modified_by;
        core::Timestamp changed_at{};
    };

    explicit FakeAuthority(const core::Clock& clock) : clock_(clock) {}

    Result<sync::DeltaResponse> exchange(const sync::DeltaRequest& request,
                                         std::chrono::milliseconds) override {
        std::function<void()> hook;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            if (!failures_.empty()) {
                Error error = failures_.front();
                failures_.pop_front();
                return Err<sync::DeltaResponse, Error>(error);
            }
            hook = before_reply_;
        }
        if (hook) {
            hook();
        }

        std::lock_guard lock(mutex_);
        sync::DeltaResponse response;
        std::vector<std::pair<store::Collection, std::string>> written;

        for (const auto& change : request.pending_changes) {
            auto key = std::make_pair(change.collection, change.entity_id);

            if (auto rule = rejections_.find(change.entity_id); rule != rejections_.end()) {
                response.rejected.push_back({change.collection, change.entity_id,
                                             rule->second.first, rule->second.second});
                continue;
            }

            bool deleted = change.op == outbox::Operation::Delete;
            auto existing = rows_.find(key);
            if (existing != rows_.end()) {
                const Row& row = existing->second;
                bool same = row.data == change.data && row.deleted == deleted;
                if (change.version <= row.version && !(same && change.version == row.version)) {
                    sync::ServerConflict conflict;
                    conflict.collection = change.collection;
                    conflict.entity_id = change.entity_id;
                    conflict.client_version = change.version;
                    conflict.server_version = row.version;
                    conflict.client_data = change.data;
                    conflict.server_data = wire_data(row);
                    response.conflicts.push_back(std::move(conflict));
                    continue;
                }
            }

            Row row;
            row.collection = change.collection;
            row.id = change.entity_id;
            row.version = change.version;
            row.data = change.data;
            row.updated_at = change.updated_at;
            row.deleted = deleted;
            row.modified_by = request.device_id;
            row.changed_at = tick();
            rows_[key] = std::move(row);
            written.push_back(key);
            ++accepted_;
        }

        for (const auto& [key, row] : rows_) {
            auto since = request.last_sync.find(key.first);
            if (since != request.last_sync.end() && row.changed_at <= since->second) {
                continue;
            }
            if (std::find(written.begin(), written.end(), key) != written.end()) {
                continue;
            }
            sync::EntityChange change;
            change.collection = row.collection;
            change.op = row.deleted ? outbox::Operation::Delete : outbox::Operation::Update;
            change.entity_id = row.id;
            change.version = row.version;
            change.data = wire_data(row);
            change.updated_at = row.updated_at;
            response.server_changes.push_back(std::move(change));
        }

        response.sync_timestamp = tick();
        return Ok(std::move(response));
    }

    /// Another device's write, already accepted by the authority.
    void seed(store::Collection collection, const std::string& id, std::uint64_t version,
              nlohmann::json data, core::Timestamp updated_at, bool deleted = false,
              std::string modified_by = "other-device") {
        std::lock_guard lock(mutex_);
        Row row;
        row.collection = collection;
        row.id = id;
        row.version = version;
        row.data = std::move(data);
        row.updated_at = updated_at;
        row.deleted = deleted;
        row.modified_by = std::move(modified_by);
        row.changed_at = tick();
        rows_[{collection, id}] = std::move(row);
    }

    std::optional<Row> row(store::Collection collection, const std::string& id) const {
        std::lock_guard lock(mutex_);
        auto it = rows_.find({collection, id});
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    /// The next `times` exchanges fail with `kind`.
    void fail_next(ErrorKind kind, int times = 1, std::string message = "injected failure") {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < times; ++i) {
            failures_.emplace_back(kind, message);
        }
    }

    void reject(const std::string& entity_id, std::string reason, bool permanent) {
        std::lock_guard lock(mutex_);
        rejections_[entity_id] = {std::move(reason), permanent};
    }

    void clear_rejections() {
        std::lock_guard lock(mutex_);
        rejections_.clear();
    }

    /// Runs after the request is captured and before it is processed.
    void before_reply(std::function<void()> hook) {
        std::lock_guard lock(mutex_);
        before_reply_ = std::move(hook);
    }

    std::size_t exchange_count() const {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

    sync::DeltaRequest last_request() const {
        std::lock_guard lock(mutex_);
        return requests_.empty() ? sync::DeltaRequest{} : requests_.back();
    }

    std::size_t accepted_count() const {
        std::lock_guard lock(mutex_);
        return accepted_;
    }

    std::size_t row_count() const {
        std::lock_guard lock(mutex_);
        return rows_.size();
    }

private:
    static nlohmann::json wire_data(const Row& row) {
        nlohmann::json data = row.data;
        data["updatedAt"] = core::to_iso8601(row.updated_at);
        data["isDeleted"] = row.deleted;
        data["lastModifiedBy"] = row.modified_by;
        return data;
    }

    /// Strictly increasing change stamp, never behind the injected clock.
    core::Timestamp tick() {
        auto now = clock_.now();
        last_tick_ = now > last_tick_ ? now : last_tick_ + std::chrono::milliseconds(1);
        return last_tick_;
    }

    const core::Clock& clock_;
    mutable std::mutex mutex_;
    std::map<std::pair<store::Collection, std::string>, Row> rows_;
    std::vector<sync::DeltaRequest> requests_;
    std::deque<Error> failures_;
    std::map<std::string, std::pair<std::string, bool>> rejections_;
    std::function<void()> before_reply_;
    core::Timestamp last_tick_{};
    std::size_t accepted_ = 0;
};

} // namespace hsync::testing
