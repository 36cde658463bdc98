#include "storage/value_codec.hpp"

#include "catalog.pb.h"

#include <string>

#include <gtest/gtest.h>

namespace chandb {

using catalog::Channel;
using catalog::ChannelMeta;
using catalog::PublishPoint;

// ── Type names ───────────────────────────────────────────────────────────────

TEST(ValueCodecTest, TypeNamesIdentifyTheValueType) {
    EXPECT_EQ(ValueCodec<std::string>::type_name(), "string");
    EXPECT_EQ(ValueCodec<Channel>::type_name(), "chandb.catalog.Channel");
    EXPECT_EQ(ValueCodec<ChannelMeta>::type_name(), "chandb.catalog.ChannelMeta");
}

// ── std::string ──────────────────────────────────────────────────────────────

TEST(ValueCodecTest, StringIsStoredVerbatim) {
    const std::string value("binary\0data", 11);
    std::string out;
    ASSERT_TRUE(ValueCodec<std::string>::encode(value, out));
    EXPECT_EQ(out, value);

    std::string decoded;
    ASSERT_TRUE(ValueCodec<std::string>::decode(out, decoded));
    EXPECT_EQ(decoded, value);
}

// ── Protobuf messages ────────────────────────────────────────────────────────

TEST(ValueCodecTest, EncodeOverwritesOutput) {
    Channel ch;
    ch.set_name("n");
    std::string out = "stale bytes";
    ASSERT_TRUE(ValueCodec<Channel>::encode(ch, out));
    EXPECT_EQ(out.find("stale"), std::string::npos);
}

TEST(ValueCodecTest, MessageSurvivesEncodeDecode) {
    ChannelMeta meta;
    meta.set_id("ch1");
    meta.set_etag("etag");
    meta.set_last_modified_unix_ms(1'700'000'000'000);
    meta.mutable_channel()->set_name("news");
    meta.mutable_channel()->add_tags("live");
    auto* pub = meta.mutable_channel()->add_publish_points();
    pub->set_id("p");
    (*pub->mutable_headers())["X-A"] = "1";

    std::string bytes;
    ASSERT_TRUE(ValueCodec<ChannelMeta>::encode(meta, bytes));

    ChannelMeta decoded;
    ASSERT_TRUE(ValueCodec<ChannelMeta>::decode(bytes, decoded));
    EXPECT_EQ(decoded.id(), "ch1");
    EXPECT_EQ(decoded.last_modified_unix_ms(), 1'700'000'000'000);
    EXPECT_EQ(decoded.channel().name(), "news");
    ASSERT_EQ(decoded.channel().publish_points_size(), 1);
    EXPECT_EQ(decoded.channel().publish_points(0).headers().at("X-A"), "1");
}

TEST(ValueCodecTest, MapEntriesEncodeInKeyOrder) {
    PublishPoint a;
    PublishPoint b;
    for (const auto* k : {"zeta", "alpha", "mid", "beta"}) {
        (*a.mutable_headers())[k] = k;
    }
    for (const auto* k : {"beta", "mid", "zeta", "alpha"}) {
        (*b.mutable_headers())[k] = k;
    }

    std::string ea;
    std::string eb;
    ASSERT_TRUE(ValueCodec<PublishPoint>::encode(a, ea));
    ASSERT_TRUE(ValueCodec<PublishPoint>::encode(b, eb));
    EXPECT_EQ(ea, eb);
}

TEST(ValueCodecTest, DecodeRejectsGarbage) {
    Channel ch;
    // Field 1 declared as length-delimited with a length past the end.
    const std::string garbage("\x0a\x7f" "abc", 5);
    EXPECT_FALSE(ValueCodec<Channel>::decode(garbage, ch));
}

} // namespace chandb
