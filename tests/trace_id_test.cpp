#include "trace/trace_id.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

#include <gtest/gtest.h>

namespace chandb::trace {

// ── new_trace_id ─────────────────────────────────────────────────────────────

TEST(TraceIdTest, HasTraceparentShape) {
    const auto id = new_trace_id();
    ASSERT_EQ(id.size(), kTraceparentLength);
    EXPECT_EQ(id.substr(0, 3), "00-");
    EXPECT_EQ(id[35], '-');
    EXPECT_EQ(id.substr(52), "-00");
    EXPECT_TRUE(is_valid_trace_id(id)) << id;
}

TEST(TraceIdTest, TenThousandIdsAreUnique) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 10'000; ++i) {
        auto id = new_trace_id();
        ASSERT_TRUE(is_valid_trace_id(id)) << id;
        ASSERT_TRUE(seen.insert(std::move(id)).second) << "duplicate at call " << i;
    }
}

// ── is_valid_trace_id ────────────────────────────────────────────────────────

TEST(TraceIdTest, AcceptsW3cExample) {
    EXPECT_TRUE(is_valid_trace_id("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"));
}

TEST(TraceIdTest, RejectsMalformedIds) {
    EXPECT_FALSE(is_valid_trace_id(""));
    // Uppercase hex.
    EXPECT_FALSE(is_valid_trace_id("00-4BF92F3577B34DA6A3CE929D0E0E4736-00f067aa0ba902b7-00"));
    // Short span id.
    EXPECT_FALSE(is_valid_trace_id("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b-000"));
    // Wrong delimiter.
    EXPECT_FALSE(is_valid_trace_id("00_4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00"));
    // Non-hex character.
    EXPECT_FALSE(is_valid_trace_id("00-4bf92f3577b34da6a3ce929d0e0e473g-00f067aa0ba902b7-00"));
    // Trailing data.
    EXPECT_FALSE(is_valid_trace_id("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00 "));
}

// ── TraceContext ─────────────────────────────────────────────────────────────

TEST(TraceContextTest, MakeGeneratesValidContext) {
    const auto ctx = TraceContext::make();
    EXPECT_TRUE(is_valid_trace_id(ctx.traceparent()));
    EXPECT_EQ(ctx.trace_id().size(), kTraceIdHexLength);
    EXPECT_EQ(ctx.span_id().size(), kSpanIdHexLength);
}

TEST(TraceContextTest, SegmentsAreExtracted) {
    const TraceContext ctx{"00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00"};
    EXPECT_EQ(ctx.trace_id(), "4bf92f3577b34da6a3ce929d0e0e4736");
    EXPECT_EQ(ctx.span_id(), "00f067aa0ba902b7");
}

TEST(TraceContextTest, CopiesShareTheSameIdentifier) {
    const auto ctx = TraceContext::make();
    const auto copy = ctx;
    EXPECT_EQ(copy.traceparent(), ctx.traceparent());
}

TEST(TraceContextTest, RejectsMalformedTraceparent) {
    EXPECT_THROW(TraceContext{"not-a-trace-id"}, std::invalid_argument);
}

} // namespace chandb::trace
