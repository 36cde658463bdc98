#pragma once

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "persistence/snapshot.hpp"
#include "storage/value_codec.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace chandb {

// ── ConcurrentStore ──────────────────────────────────────────────────────────
//
// Thread-safe key-value store holding a single value type V, with optional
// write-through persistence to a snapshot file.
//
// Concurrency model:
//   - load() / keys() / size() / snapshot() / range() acquire a shared lock.
//   - store() / del() acquire an exclusive lock for the map mutation.
//   - On a file-backed store, writers are additionally serialised by
//     persist_mutex_ so that snapshot files land in mutation order. The map
//     is encoded under the shared lock and written to disk outside it, so
//     readers are not held up by disk I/O.
//
// Persistence: every successful mutation of a file-backed store rewrites the
// whole snapshot file before returning (O(n) in the number of entries).
// A write failure is logged and returned; the in-memory change is kept.

template <typename V>
class ConcurrentStore {
public:
    using Visitor = std::function<bool(const std::string&, const V&)>;

    // Memory-only store when `snapshot_path` is empty. Otherwise loads the
    // existing snapshot, starts empty if there is none, and throws
    // SnapshotLoadError if the file exists but cannot be decoded.
    explicit ConcurrentStore(std::filesystem::path snapshot_path = {},
                             std::shared_ptr<spdlog::logger> logger = {})
        : snapshot_path_{std::move(snapshot_path)}
        , logger_{logger_or_default(std::move(logger))}
    {
        if (!snapshot_path_.empty()) {
            restore();
        }
    }

    // Not copyable or movable – the store owns its snapshot file.
    ConcurrentStore(const ConcurrentStore&)            = delete;
    ConcurrentStore& operator=(const ConcurrentStore&) = delete;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<V> load(std::string_view key) const {
        std::shared_lock lock(mutex_);
        auto it = map_.find(std::string(key));
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Inserts or overwrites `key` with `value`. On a file-backed store the
    // snapshot has been rewritten when this returns; the result is the
    // persistence error, if any. An empty key is rejected with
    // std::errc::invalid_argument and nothing is stored.
    std::error_code store(std::string key, V value) {
        if (key.empty()) {
            logger_->warn("ConcurrentStore: rejected store with empty key");
            return std::make_error_code(std::errc::invalid_argument);
        }

        if (!persistent()) {
            std::unique_lock lock(mutex_);
            map_.insert_or_assign(std::move(key), std::move(value));
            return {};
        }

        std::lock_guard persist_lock(persist_mutex_);
        {
            std::unique_lock lock(mutex_);
            map_.insert_or_assign(std::move(key), std::move(value));
        }
        return persist();
    }

    // Removes `key` if present. Removing an absent key is a no-op that does
    // not touch the snapshot file.
    std::error_code del(std::string_view key) {
        if (!persistent()) {
            std::unique_lock lock(mutex_);
            map_.erase(std::string(key));
            return {};
        }

        std::lock_guard persist_lock(persist_mutex_);
        {
            std::unique_lock lock(mutex_);
            if (map_.erase(std::string(key)) == 0) {
                return {};
            }
        }
        return persist();
    }

    // Calls `visit` for each entry (order unspecified) until it returns false.
    // Iterates over a point-in-time copy, so `visit` may call back into the
    // store and concurrent mutations are not observed.
    void range(const Visitor& visit) const {
        for (const auto& [k, v] : snapshot()) {
            if (!visit(k, v)) {
                break;
            }
        }
    }

    // Returns a snapshot of all keys (order is unspecified).
    [[nodiscard]] std::vector<std::string> keys() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(map_.size());
        for (const auto& [k, _] : map_) {
            result.push_back(k);
        }
        return result;
    }

    // Returns the number of stored entries.
    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return map_.size();
    }

    // Returns a full copy of the current state.
    [[nodiscard]] std::unordered_map<std::string, V> snapshot() const {
        std::shared_lock lock(mutex_);
        return map_;
    }

    [[nodiscard]] bool persistent() const noexcept { return !snapshot_path_.empty(); }

    [[nodiscard]] const std::filesystem::path& snapshot_path() const noexcept {
        return snapshot_path_;
    }

private:
    // Populate map_ from the snapshot file. Called from the constructor only.
    void restore() {
        persistence::SnapshotLoadResult result;
        auto ec = persistence::Snapshot::load(snapshot_path_, result);
        if (ec == std::errc::no_such_file_or_directory) {
            logger_->info("ConcurrentStore: no snapshot at {}, starting empty",
                          snapshot_path_.string());
            return;
        }
        if (ec) {
            throw SnapshotLoadError(snapshot_path_.string() + ": " + ec.message());
        }

        const auto expected_type = ValueCodec<V>::type_name();
        if (result.value_type != expected_type) {
            throw SnapshotLoadError(snapshot_path_.string() +
                                    ": holds values of type '" + result.value_type +
                                    "', expected '" + expected_type + "'");
        }

        map_.reserve(result.data.size());
        for (auto& [k, bytes] : result.data) {
            V value{};
            if (!ValueCodec<V>::decode(bytes, value)) {
                throw SnapshotLoadError(snapshot_path_.string() +
                                        ": failed to decode value for key '" + k + "'");
            }
            map_.emplace(k, std::move(value));
        }

        logger_->info("ConcurrentStore: restored {} entries from {}",
                      map_.size(), snapshot_path_.string());
    }

    // Encode the whole map and rewrite the snapshot file.
    // Caller must hold persist_mutex_.
    std::error_code persist() {
        std::unordered_map<std::string, std::string> encoded;
        {
            std::shared_lock lock(mutex_);
            encoded.reserve(map_.size());
            for (const auto& [k, v] : map_) {
                std::string bytes;
                if (!ValueCodec<V>::encode(v, bytes)) {
                    logger_->error("ConcurrentStore: failed to encode value for key '{}'", k);
                    return std::make_error_code(std::errc::invalid_argument);
                }
                encoded.emplace(k, std::move(bytes));
            }
        }

        auto ec = persistence::Snapshot::save(snapshot_path_,
                                              ValueCodec<V>::type_name(),
                                              encoded);
        if (ec) {
            logger_->error("ConcurrentStore: failed to persist {} entries to {}: {}",
                           encoded.size(), snapshot_path_.string(), ec.message());
        } else {
            logger_->trace("ConcurrentStore: persisted {} entries to {}",
                           encoded.size(), snapshot_path_.string());
        }
        return ec;
    }

    std::filesystem::path snapshot_path_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex mutex_;
    std::mutex persist_mutex_;
    std::unordered_map<std::string, V> map_;
};

} // namespace chandb
