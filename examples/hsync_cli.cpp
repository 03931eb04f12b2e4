#include "hsync/core/clock.hpp"
#include "hsync/core/config.hpp"
#include "hsync/events/components.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/network/http_transport.hpp"
#include "hsync/outbox/local_writer.hpp"
#include "hsync/outbox/outbox.hpp"
#include "hsync/persistence/journal.hpp"
#include "hsync/store/entity_store.hpp"
#include "hsync/store/payload.hpp"
#include "hsync/sync/conflict_store.hpp"
#include "hsync/sync/coordinator.hpp"
#include "hsync/sync/metadata.hpp"
#include "hsync/sync/scheduler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using hsync::Result;
using hsync::core::SyncConfig;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE] [--data DIR] [--endpoint URL] [-v] COMMAND [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  create <collection> <json>            Create a record with a fresh id\n"
              << "  put <collection> <id> <json>          Create or update fields of a record\n"
              << "  delete <collection> <id>              Tombstone a record\n"
              << "  get <collection> <id>                 Show one record\n"
              << "  list <collection> [--status S] [--assignee P] [--deleted]\n"
              << "  sync                                  Run one sync cycle\n"
              << "  watch <seconds>                       Auto-sync in the background for a while\n"
              << "  conflicts                             List conflicts awaiting review\n"
              << "  diff <conflict-id>                    Field diff of a conflict\n"
              << "  resolve <conflict-id> <client|server|merge> [field=client|server ...]\n"
              << "  failed                                List permanently failed operations\n"
              << "  retry-failed                          Move failed operations back to pending\n"
              << "  purge <collection> <id>               Remove an acknowledged tombstone\n"
              << "  stats                                 Pending / failed / conflict counts\n"
              << "\n"
              << "Collections: tasks, events, points_ledger\n";
}

int fail(const hsync::core::Error& error) {
    spdlog::error("{}: {}", hsync::core::to_string(error.kind), error.message);
    return 1;
}

std::optional<json> parse_json_arg(const std::string& text) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::error("expected a JSON object, got: {}", text);
        return std::nullopt;
    }
    return doc;
}

void print_record(const hsync::store::Record& record) {
    std::cout << hsync::store::record_to_json(record).dump(2) << "\n";
}

void print_report(const hsync::sync::SyncReport& report) {
    json j;
    j["outcome"] = hsync::sync::outcome_name(report.outcome);
    j["changes_sent"] = report.changes_sent;
    j["confirmed"] = report.confirmed;
    j["server_changes"] = report.server_changes;
    j["applied"] = report.applied;
    j["auto_resolved"] = report.auto_resolved;
    j["manual_conflicts"] = report.manual_conflicts;
    j["rejected"] = report.rejected;
    j["moved_to_failed"] = report.moved_to_failed;
    j["entity_errors"] = report.entity_errors;
    j["duration_ms"] = report.duration.count();
    if (report.error) {
        j["error"] = report.error->message;
    }
    if (report.sync_timestamp) {
        j["sync_timestamp"] = hsync::core::to_iso8601(*report.sync_timestamp);
    }
    std::cout << j.dump(2) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    SyncConfig config;
    std::optional<std::string> data_dir;
    std::optional<std::string> endpoint;
    bool verbose = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = hsync::core::load_config(argv[++i]);
            if (loaded.is_error()) {
                return fail(loaded.error());
            }
            config = loaded.value();
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            data_dir = argv[++i];
        } else if ((arg == "-e" || arg == "--endpoint") && i + 1 < argc) {
            endpoint = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (data_dir) config.data_dir = *data_dir;
    if (endpoint) config.endpoint = *endpoint;

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string command = args[0];

    hsync::core::SystemClock clock;
    hsync::persistence::JournalBackend backend(config.data_dir);
    hsync::events::EventBus bus;
    hsync::events::LoggerComponent logger(bus);
    hsync::events::MetricsComponent metrics(bus);

    hsync::store::EntityStore store(clock, backend, config.actor_id);
    hsync::outbox::Outbox outbox(clock, backend, static_cast<std::uint32_t>(config.max_retries));
    hsync::sync::ConflictStore conflicts(clock, backend);
    hsync::sync::MetadataStore metadata(backend);

    auto opened = store.open();
    if (opened.is_error()) {
        // Halted collections stay readable; the rest of the store is usable.
        spdlog::warn("store opened with errors: {}", opened.error().message);
    }
    for (auto result : {outbox.open(), conflicts.open(), metadata.open()}) {
        if (result.is_error()) {
            return fail(result.error());
        }
    }

    hsync::outbox::LocalWriter writer(store, outbox, &bus);

    auto collection_arg = [&](std::size_t index) -> std::optional<hsync::store::Collection> {
        if (args.size() <= index) {
            print_usage(argv[0]);
            return std::nullopt;
        }
        auto parsed = hsync::store::parse_collection(args[index]);
        if (parsed.is_error()) {
            fail(parsed.error());
            return std::nullopt;
        }
        return parsed.value();
    };

    auto print_write = [&](const Result<hsync::store::Record>& result) {
        if (result.is_error()) {
            return fail(result.error());
        }
        print_record(result.value());
        return 0;
    };

    if (command == "create") {
        auto collection = collection_arg(1);
        if (!collection || args.size() < 3) return 1;
        auto fields = parse_json_arg(args[2]);
        if (!fields) return 1;
        return print_write(writer.create(*collection, *fields));
    }

    if (command == "put") {
        auto collection = collection_arg(1);
        if (!collection || args.size() < 4) return 1;
        auto fields = parse_json_arg(args[3]);
        if (!fields) return 1;
        return print_write(writer.put(*collection, args[2], *fields));
    }

    if (command == "delete") {
        auto collection = collection_arg(1);
        if (!collection || args.size() < 3) return 1;
        return print_write(writer.remove(*collection, args[2]));
    }

    if (command == "get") {
        auto collection = collection_arg(1);
        if (!collection || args.size() < 3) return 1;
        auto record = store.get(*collection, args[2]);
        if (!record) {
            spdlog::error("no such record: {}", args[2]);
            return 1;
        }
        print_record(*record);
        return 0;
    }

    if (command == "list") {
        auto collection = collection_arg(1);
        if (!collection) return 1;

        hsync::store::QueryOptions options;
        std::optional<hsync::store::TaskStatus> status;
        std::optional<std::string> assignee;
        for (std::size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "--status" && i + 1 < args.size()) {
                status = hsync::store::parse_status(args[++i]);
                if (!status) {
                    spdlog::error("unknown status: {}", args[i]);
                    return 1;
                }
            } else if (args[i] == "--assignee" && i + 1 < args.size()) {
                assignee = args[++i];
            } else if (args[i] == "--deleted") {
                options.include_deleted = true;
            }
        }

        std::vector<hsync::store::Record> records;
        if (status) {
            records = store.by_status(*collection, *status, options);
        } else if (assignee) {
            records = store.by_assignee(*collection, *assignee, options);
        } else {
            records = store.query(*collection, [](const hsync::store::Record&) { return true; }, options);
        }

        json out = json::array();
        for (const auto& record : records) {
            out.push_back(hsync::store::record_to_json(record));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "failed") {
        json out = json::array();
        for (const auto& entry : outbox.failed_entries()) {
            out.push_back(hsync::outbox::entry_to_json(entry));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "retry-failed") {
        auto moved = outbox.retry_all_failed();
        if (moved.is_error()) {
            return fail(moved.error());
        }
        spdlog::info("{} failed operations moved back to pending", moved.value());
        return 0;
    }

    if (command == "purge") {
        auto collection = collection_arg(1);
        if (!collection || args.size() < 3) return 1;
        auto purged = store.purge(*collection, args[2]);
        if (purged.is_error()) {
            return fail(purged.error());
        }
        spdlog::info("purged {}/{}", args[1], args[2]);
        return 0;
    }

    // Everything below needs the coordinator
    std::unique_ptr<hsync::network::HttpTransport> transport;
    if (config.endpoint.empty()) {
        if (command == "sync" || command == "watch") {
            spdlog::error("no endpoint configured (use --endpoint or the config file)");
            return 1;
        }
        transport = std::make_unique<hsync::network::HttpTransport>(hsync::network::Endpoint{"localhost", 80, ""});
    } else {
        auto parsed = hsync::network::parse_endpoint(config.endpoint);
        if (parsed.is_error()) {
            return fail(parsed.error());
        }
        transport = std::make_unique<hsync::network::HttpTransport>(parsed.value());
    }

    hsync::sync::SyncCoordinator coordinator(config, clock, store, outbox, writer, conflicts, metadata,
                                             *transport, &bus);

    if (command == "sync") {
        auto report = coordinator.run_cycle();
        print_report(report);
        return report.ok() ? 0 : 2;
    }

    if (command == "watch") {
        int seconds = args.size() > 1 ? std::stoi(args[1]) : 60;
        hsync::sync::SyncScheduler scheduler(
            coordinator, std::chrono::duration_cast<std::chrono::milliseconds>(config.auto_sync_interval), &bus);
        scheduler.start();
        scheduler.request_sync();
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        scheduler.stop();
        metrics.print_stats();
        return 0;
    }

    if (command == "conflicts") {
        json out = json::array();
        for (const auto& conflict : conflicts.pending()) {
            out.push_back(hsync::sync::conflict_to_json(conflict));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "diff") {
        if (args.size() < 2) {
            print_usage(argv[0]);
            return 1;
        }
        auto diff = coordinator.conflict_diff(args[1]);
        if (diff.is_error()) {
            return fail(diff.error());
        }
        json out = json::object();
        for (const auto& [field, entry] : diff.value()) {
            out[field] = {{"client", entry.client_value},
                          {"server", entry.server_value},
                          {"conflict", entry.has_conflict}};
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "resolve") {
        if (args.size() < 3) {
            print_usage(argv[0]);
            return 1;
        }
        auto choice = hsync::sync::parse_choice(args[2]);
        if (!choice) {
            spdlog::error("unknown choice: {} (client, server, merge)", args[2]);
            return 1;
        }
        hsync::sync::FieldPicks picks;
        for (std::size_t i = 3; i < args.size(); ++i) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos) {
                spdlog::error("field pick must look like field=client or field=server: {}", args[i]);
                return 1;
            }
            std::string side = args[i].substr(eq + 1);
            if (side != "client" && side != "server") {
                spdlog::error("unknown side: {}", side);
                return 1;
            }
            picks[args[i].substr(0, eq)] =
                side == "client" ? hsync::sync::Side::Client : hsync::sync::Side::Server;
        }
        return print_write(coordinator.resolve_conflict(args[1], *choice, picks));
    }

    if (command == "stats") {
        auto stats = coordinator.stats();
        json out;
        out["pending_operations"] = stats.pending_operations;
        out["failed_operations"] = stats.failed_operations;
        out["pending_conflicts"] = stats.pending_conflicts;
        out["dirty_records"] = stats.dirty_records;
        out["needs_attention"] = stats.needs_attention();
        for (auto collection : hsync::store::all_collections()) {
            auto last = metadata.last_sync_at(collection);
            out["last_sync"][hsync::store::collection_name(collection)] =
                last ? json(hsync::core::to_iso8601(*last)) : json(nullptr);
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    spdlog::error("unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
