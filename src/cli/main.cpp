#include "catalog.pb.h"
#include "catalog/channel_catalog.hpp"
#include "common/cli_config.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "storage/concurrent_store.hpp"
#include "trace/trace_id.hpp"

#include <google/protobuf/util/json_util.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using chandb::catalog::Channel;
using chandb::catalog::ChannelMeta;

// Parse channel JSON (proto3 JSON mapping, snake_case field names accepted).
bool parse_channel(const std::string& json, Channel& channel) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    auto status = google::protobuf::util::JsonStringToMessage(json, &channel, options);
    if (!status.ok()) {
        fprintf(stderr, "Invalid channel JSON: %s\n", status.ToString().c_str());
        return false;
    }
    return true;
}

std::string to_json(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok()) {
        throw std::runtime_error("failed to render JSON: " + status.ToString());
    }
    return out;
}

chandb::Clock::time_point from_unix_ms(int64_t ms) {
    return chandb::Clock::time_point{std::chrono::milliseconds{ms}};
}

int run_put(chandb::catalog::ChannelCatalog& catalog,
            const chandb::trace::TraceContext& ctx,
            const chandb::CliConfig& cfg) {
    Channel channel;
    if (!parse_channel(cfg.args[1], channel)) {
        return 1;
    }

    chandb::catalog::Preconditions conditions;
    conditions.if_match      = cfg.if_match;
    conditions.if_none_match = cfg.if_none_match;
    if (cfg.if_modified_since_ms) {
        conditions.if_modified_since = from_unix_ms(*cfg.if_modified_since_ms);
    }
    if (cfg.if_unmodified_since_ms) {
        conditions.if_unmodified_since = from_unix_ms(*cfg.if_unmodified_since_ms);
    }

    auto result = catalog.put(ctx, cfg.args[0], channel, conditions);
    switch (result.status) {
    case chandb::catalog::PutStatus::Created:
    case chandb::catalog::PutStatus::Updated:
    case chandb::catalog::PutStatus::NotModified:
        fprintf(stdout, "%s %s\n", chandb::catalog::to_string(result.status),
                result.etag.c_str());
        return 0;
    case chandb::catalog::PutStatus::PreconditionFailed:
        for (const auto& failure : result.failures) {
            fprintf(stderr, "Precondition failed: %s\n", failure.c_str());
        }
        return 2;
    case chandb::catalog::PutStatus::InvalidId:
        fprintf(stderr, "Invalid channel id '%s' (expected [a-zA-Z0-9_-]{2,60})\n",
                cfg.args[0].c_str());
        return 1;
    case chandb::catalog::PutStatus::PersistFailed:
        fprintf(stderr, "Channel stored but not persisted: %s\n",
                result.error.message().c_str());
        return 1;
    }
    return 1;
}

int run(const chandb::CliConfig& cfg, spdlog::level::level_enum level) {
    namespace fs = std::filesystem;

    // Commands that do not touch the store.
    if (cfg.command == chandb::CliCommand::TraceId) {
        fprintf(stdout, "%s\n", chandb::trace::new_trace_id().c_str());
        return 0;
    }
    if (cfg.command == chandb::CliCommand::Hash) {
        Channel channel;
        if (!parse_channel(cfg.args[0], channel)) {
            return 1;
        }
        fprintf(stdout, "%s\n", chandb::crypto::hash(channel).c_str());
        return 0;
    }

    const auto ctx = cfg.traceparent.empty()
        ? chandb::trace::TraceContext::make()
        : chandb::trace::TraceContext{cfg.traceparent};

    chandb::catalog::ChannelStore store{fs::path{cfg.db_path},
                                        chandb::make_logger("store", level)};
    chandb::SystemClock clock;
    chandb::catalog::ChannelCatalog catalog{store, clock,
                                            chandb::make_logger("catalog", level)};

    switch (cfg.command) {
    case chandb::CliCommand::Put:
        return run_put(catalog, ctx, cfg);

    case chandb::CliCommand::Get: {
        auto meta = catalog.get(ctx, cfg.args[0]);
        if (!meta) {
            fprintf(stderr, "Channel '%s' not found\n", cfg.args[0].c_str());
            return 1;
        }
        fprintf(stdout, "%s\n", to_json(*meta).c_str());
        return 0;
    }

    case chandb::CliCommand::List:
        for (const auto& meta : catalog.list(ctx)) {
            fprintf(stdout, "%s\t%s\t%lld\n", meta.id().c_str(), meta.etag().c_str(),
                    static_cast<long long>(meta.last_modified_unix_ms()));
        }
        return 0;

    case chandb::CliCommand::Delete:
        if (auto ec = catalog.remove(ctx, cfg.args[0])) {
            fprintf(stderr, "Delete not persisted: %s\n", ec.message().c_str());
            return 1;
        }
        return 0;

    case chandb::CliCommand::Hash:
    case chandb::CliCommand::TraceId:
        break;
    }
    return 0;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    chandb::CliConfig cfg;
    try {
        cfg = chandb::parse_cli_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const auto level = chandb::parse_log_level(cfg.log_level);
    chandb::init_default_logger(level);

    spdlog::debug("chandb-cli db='{}'", cfg.db_path);

    try {
        return run(cfg, level);
    } catch (const chandb::SnapshotLoadError& e) {
        spdlog::critical("chandb-cli: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("chandb-cli: exception: {}", e.what());
        return 1;
    }
}
