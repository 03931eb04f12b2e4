#pragma once

/**
 * @file conflict.hpp
 * @brief Conflict classification, records and the pure resolver
 *
 * ConflictResolver never touches storage. It reads two Records and returns
 * a Resolution; SyncCoordinator performs every write that follows from it.
 *
 * Automatic resolution order, first match wins:
 *   1. deleteWins      either side deleted -> the tombstone
 *   2. statusPriority  tasks, both have a status, statuses differ
 *                      (done > pendingApproval > open)
 *   3. lastWriteWins   strictly later updated_at; ties fall through
 *   4. manual          needs_manual_review, no resolved payload
 */

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/store/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hsync::sync {

using core::Timestamp;

enum class ConflictKind {
    Status,
    DeleteUpdate,
    ConcurrentUpdate,
    VersionRollback
};

const char* kind_name(ConflictKind kind);
/// Wire names; "version_mismatch" is read as a concurrent update.
std::optional<ConflictKind> parse_kind(const std::string& name);

enum class Strategy {
    DeleteWins,
    StatusPriority,
    LastWriteWins,
    Merge,
    KeepClient,
    KeepServer,
    Manual
};

const char* strategy_name(Strategy strategy);
std::optional<Strategy> parse_strategy(const std::string& name);

enum class Winner {
    None,
    Client,
    Server,
    Merged
};

const char* winner_name(Winner winner);
std::optional<Winner> parse_winner(const std::string& name);

/// The explicit choice a reviewer makes for a manual conflict.
enum class ResolutionChoice {
    KeepClient,
    KeepServer,
    Merge
};

std::optional<ResolutionChoice> parse_choice(const std::string& name);

enum class Side {
    Client,
    Server
};

/// Per-field side picks for scalar fields a merge cannot combine.
using FieldPicks = std::map<std::string, Side>;

struct Resolution {
    Strategy strategy = Strategy::Manual;
    std::optional<store::Payload> resolved_payload;  ///< Absent when manual review is needed
    bool resolved_deleted = false;
    Winner winner = Winner::None;
    bool needs_manual_review = false;
    std::vector<std::string> unresolved_fields;      ///< Merge only: fields that need a pick
    std::string explanation;
};

struct FieldDiff {
    nlohmann::json client_value;
    nlohmann::json server_value;
    bool has_conflict = false;
};

/**
 * @brief A detected divergence between this device and the authority
 *
 * Snapshots are full Records so a reviewer sees envelope and payload.
 */
struct ConflictRecord {
    std::string conflict_id;
    store::Collection collection = store::Collection::Tasks;
    std::string entity_id;
    std::uint64_t client_version = 0;
    std::uint64_t server_version = 0;
    store::Record client;
    store::Record server;
    ConflictKind kind = ConflictKind::ConcurrentUpdate;
    std::optional<Resolution> resolution;
    bool needs_manual_review = false;
    Timestamp detected_at{};
    std::optional<Timestamp> resolved_at;

    bool is_resolved() const { return resolution.has_value(); }
};

nlohmann::json resolution_to_json(const Resolution& resolution, store::Collection collection);
Result<Resolution> resolution_from_json(const nlohmann::json& doc, store::Collection collection);

nlohmann::json conflict_to_json(const ConflictRecord& conflict);
Result<ConflictRecord> conflict_from_json(const nlohmann::json& doc);

class ConflictResolver {
public:
    /// Automatic decision for a client/server pair of the same id.
    Resolution resolve(const store::Record& client, const store::Record& server) const;

    /**
     * @brief Field-level merge of a recorded conflict
     *
     * Arrays merge by union (client order, then new server items), integers
     * by max, task status by priority. Fields present on one side only are
     * kept. Any other differing field takes the side named in `picks`; if no
     * pick is given the result needs manual review and lists the field in
     * unresolved_fields.
     *
     * Fails with InvalidState when a delete is involved.
     */
    Result<Resolution> merge(const ConflictRecord& conflict, const FieldPicks& picks = {}) const;

    /// False whenever either side is deleted.
    bool can_merge(const ConflictRecord& conflict) const;

    /// Field-by-field comparison over the union of payload fields.
    std::map<std::string, FieldDiff> get_diff(const ConflictRecord& conflict) const;

    /**
     * @brief Turn a reviewer's choice into a Resolution
     *
     * A merge that still has unresolved fields is a Validation error naming them.
     */
    Result<Resolution> choose(const ConflictRecord& conflict, ResolutionChoice choice,
                              const FieldPicks& picks = {}) const;

    static ConflictKind classify(const store::Record& client, const store::Record& server);
};

} // namespace hsync::sync
