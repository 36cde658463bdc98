#pragma once

#include "catalog.pb.h"
#include "catalog/preconditions.hpp"
#include "common/clock.hpp"
#include "storage/concurrent_store.hpp"
#include "trace/trace_id.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace chandb::catalog {

using ChannelStore = ConcurrentStore<ChannelMeta>;

// ── Put outcome ──────────────────────────────────────────────────────────────

enum class PutStatus : uint8_t {
    Created,             // no channel existed under the id
    Updated,             // an existing channel was replaced
    NotModified,         // the new channel hashes equal to the stored one
    PreconditionFailed,  // a conditional check failed; nothing stored
    InvalidId,           // id does not match [a-zA-Z0-9_-]{2,60}
    PersistFailed,       // stored in memory but the snapshot write failed
};

struct PutResult {
    PutStatus status = PutStatus::Created;
    std::string etag;                   // ETag of the channel now stored
    std::vector<std::string> failures;  // precondition failure messages
    std::error_code error;              // set for PersistFailed
};

[[nodiscard]] const char* to_string(PutStatus status) noexcept;

// True if `id` is 2–60 characters from [a-zA-Z0-9_-].
[[nodiscard]] bool is_valid_channel_id(std::string_view id) noexcept;

// ── ChannelCatalog ───────────────────────────────────────────────────────────
//
// CRUD over channel definitions with ETag-based optimistic concurrency.
// Every operation takes the caller's TraceContext and logs one line tagged
// with its trace id.
//
// Thread-safe. Reads go straight to the ChannelStore; put() and remove() are
// serialised by write_mutex_ so that a precondition holds until the write
// it guards has landed.

class ChannelCatalog {
public:
    ChannelCatalog(ChannelStore& store,
                   const Clock& clock,
                   std::shared_ptr<spdlog::logger> logger = {});

    // All channels, most recently modified first (ties ordered by id).
    [[nodiscard]] std::vector<ChannelMeta> list(const trace::TraceContext& ctx) const;

    // The channel stored under `id`, if any.
    [[nodiscard]] std::optional<ChannelMeta> get(const trace::TraceContext& ctx,
                                                 std::string_view id) const;

    // Create or replace the channel under `id`.
    //   1. Reject malformed ids.
    //   2. Evaluate `conditions` against the current ETag / last-modified.
    //   3. Skip the write if the content hash is unchanged.
    //   4. Store with a fresh ETag and last-modified time.
    [[nodiscard]] PutResult put(const trace::TraceContext& ctx,
                                const std::string& id,
                                const Channel& channel,
                                const Preconditions& conditions = {});

    // Delete the channel under `id`. Deleting a missing channel succeeds.
    std::error_code remove(const trace::TraceContext& ctx, std::string_view id);

private:
    ChannelStore& store_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex write_mutex_;
};

} // namespace chandb::catalog
