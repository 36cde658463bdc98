#include "catalog/channel_catalog.hpp"

#include "common/logger.hpp"
#include "crypto/hasher.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <utility>

namespace chandb::catalog {

namespace {

constexpr std::size_t kMinIdLength = 2;
constexpr std::size_t kMaxIdLength = 60;

Clock::time_point from_unix_ms(int64_t ms) {
    return Clock::time_point{std::chrono::milliseconds{ms}};
}

int64_t to_unix_ms(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

} // anonymous namespace

const char* to_string(PutStatus status) noexcept {
    switch (status) {
    case PutStatus::Created:            return "created";
    case PutStatus::Updated:            return "updated";
    case PutStatus::NotModified:        return "not_modified";
    case PutStatus::PreconditionFailed: return "precondition_failed";
    case PutStatus::InvalidId:          return "invalid_id";
    case PutStatus::PersistFailed:      return "persist_failed";
    }
    return "unknown";
}

bool is_valid_channel_id(std::string_view id) noexcept {
    if (id.size() < kMinIdLength || id.size() > kMaxIdLength) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

ChannelCatalog::ChannelCatalog(ChannelStore& store,
                               const Clock& clock,
                               std::shared_ptr<spdlog::logger> logger)
    : store_{store}
    , clock_{clock}
    , logger_{logger_or_default(std::move(logger))}
{}

// ── list ─────────────────────────────────────────────────────────────────────

std::vector<ChannelMeta> ChannelCatalog::list(const trace::TraceContext& ctx) const {
    std::vector<ChannelMeta> metas;
    store_.range([&metas](const std::string&, const ChannelMeta& meta) {
        metas.push_back(meta);
        return true;
    });

    // The store has no stable order; sort so clients see one.
    std::sort(metas.begin(), metas.end(),
              [](const ChannelMeta& a, const ChannelMeta& b) {
                  if (a.last_modified_unix_ms() != b.last_modified_unix_ms()) {
                      return a.last_modified_unix_ms() > b.last_modified_unix_ms();
                  }
                  return a.id() < b.id();
              });

    logger_->info("list channels count={} trace_id={}", metas.size(), ctx.trace_id());
    return metas;
}

// ── get ──────────────────────────────────────────────────────────────────────

std::optional<ChannelMeta> ChannelCatalog::get(const trace::TraceContext& ctx,
                                               std::string_view id) const {
    auto meta = store_.load(id);
    logger_->info("get channel id={} found={} trace_id={}",
                  id, meta.has_value(), ctx.trace_id());
    return meta;
}

// ── put ──────────────────────────────────────────────────────────────────────

PutResult ChannelCatalog::put(const trace::TraceContext& ctx,
                              const std::string& id,
                              const Channel& channel,
                              const Preconditions& conditions) {
    PutResult result;

    if (!is_valid_channel_id(id)) {
        result.status = PutStatus::InvalidId;
        logger_->info("put channel id={} status={} trace_id={}",
                      id, to_string(result.status), ctx.trace_id());
        return result;
    }

    // Load, check and store must not interleave with another writer.
    std::lock_guard lock(write_mutex_);

    std::string current_etag;
    Clock::time_point current_modified{};
    auto existing = store_.load(id);
    if (existing) {
        current_etag = existing->etag();
        current_modified = from_unix_ms(existing->last_modified_unix_ms());
    }

    if (!conditions.empty()) {
        result.failures = conditions.evaluate(current_etag, current_modified);
        if (!result.failures.empty()) {
            result.status = PutStatus::PreconditionFailed;
            result.etag = current_etag;
            logger_->info("put channel id={} status={} reason=\"{}\" trace_id={}",
                          id, to_string(result.status), result.failures.front(),
                          ctx.trace_id());
            return result;
        }
    }

    const auto etag = crypto::hash(channel);

    if (existing && etag == crypto::hash(existing->channel())) {
        result.status = PutStatus::NotModified;
        result.etag = etag;
        logger_->info("put channel id={} status={} trace_id={}",
                      id, to_string(result.status), ctx.trace_id());
        return result;
    }

    ChannelMeta meta;
    meta.set_id(id);
    meta.set_etag(etag);
    meta.set_last_modified_unix_ms(to_unix_ms(clock_.now()));
    *meta.mutable_channel() = channel;

    result.etag = etag;
    result.status = existing ? PutStatus::Updated : PutStatus::Created;

    if (auto ec = store_.store(id, std::move(meta))) {
        result.status = PutStatus::PersistFailed;
        result.error = ec;
        logger_->error("put channel id={} status={} error=\"{}\" trace_id={}",
                       id, to_string(result.status), ec.message(), ctx.trace_id());
        return result;
    }

    logger_->info("put channel id={} status={} etag={} trace_id={}",
                  id, to_string(result.status), etag, ctx.trace_id());
    return result;
}

// ── remove ───────────────────────────────────────────────────────────────────

std::error_code ChannelCatalog::remove(const trace::TraceContext& ctx,
                                       std::string_view id) {
    std::lock_guard lock(write_mutex_);
    auto ec = store_.del(id);
    if (ec) {
        logger_->error("delete channel id={} error=\"{}\" trace_id={}",
                       id, ec.message(), ctx.trace_id());
    } else {
        logger_->info("delete channel id={} trace_id={}", id, ctx.trace_id());
    }
    return ec;
}

} // namespace chandb::catalog
