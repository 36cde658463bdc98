#include "crypto/hasher.hpp"

#include "catalog.pb.h"

#include <set>
#include <string>

#include <gtest/gtest.h>

namespace chandb::crypto {

namespace {

using catalog::Channel;
using catalog::PublishPoint;

Channel make_channel() {
    Channel ch;
    ch.set_name("test channel");
    ch.set_region("us-west");
    ch.set_on(true);
    ch.set_segment_duration(6);
    auto* enc = ch.add_video_encoders();
    enc->set_id("hd");
    enc->set_width(1920);
    enc->set_height(1080);
    enc->set_bitrate(2000);
    enc->set_framerate(30);
    auto* pub = ch.add_publish_points();
    pub->set_id("pub1");
    pub->set_format("hls");
    pub->set_url("http://example.com");
    pub->add_drms("fairplay");
    return ch;
}

bool is_url_safe(const std::string& s) {
    for (char c : s) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '=';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ── hash_bytes ───────────────────────────────────────────────────────────────

TEST(HasherTest, HashBytesMatchesKnownSha1) {
    // SHA-1("abc") = a9993e364706816aba3e25717850c26c9cd0d89d
    EXPECT_EQ(hash_bytes("abc"), "qZk-NkcGgWq6PiVxeFDCbJzQ2J0=");
}

TEST(HasherTest, HashOfEmptyInput) {
    // SHA-1("") = da39a3ee5e6b4b0d3255bfef95601890afd80709
    EXPECT_EQ(hash_bytes(""), "2jmj7l5rSw0yVb_vlWAYkK_YBwk=");
}

TEST(HasherTest, DigestIsFixedLengthAndHeaderSafe) {
    for (const auto* input : {"", "a", "hello world", "\xff\xfe binary"}) {
        auto digest = hash_bytes(input);
        EXPECT_EQ(digest.size(), kDigestLength) << input;
        EXPECT_TRUE(is_url_safe(digest)) << digest;
    }
}

// ── hash(value) ──────────────────────────────────────────────────────────────

TEST(HasherTest, HashIsDeterministic) {
    const auto ch = make_channel();
    EXPECT_EQ(hash(ch), hash(ch));
}

TEST(HasherTest, IndependentlyBuiltEqualValuesHashEqual) {
    EXPECT_EQ(hash(make_channel()), hash(make_channel()));
}

TEST(HasherTest, MapInsertionOrderDoesNotMatter) {
    PublishPoint a;
    a.set_id("pub");
    (*a.mutable_headers())["X-One"] = "1";
    (*a.mutable_headers())["X-Two"] = "2";
    (*a.mutable_headers())["X-Three"] = "3";

    PublishPoint b;
    b.set_id("pub");
    (*b.mutable_headers())["X-Three"] = "3";
    (*b.mutable_headers())["X-One"] = "1";
    (*b.mutable_headers())["X-Two"] = "2";

    EXPECT_EQ(hash(a), hash(b));
}

TEST(HasherTest, FieldSetOrderDoesNotMatter) {
    Channel a;
    a.set_name("n");
    a.set_region("us-east");
    a.set_segment_duration(4);

    Channel b;
    b.set_segment_duration(4);
    b.set_region("us-east");
    b.set_name("n");

    EXPECT_EQ(hash(a), hash(b));
}

TEST(HasherTest, ChangingAnyFieldChangesHash) {
    const auto base = hash(make_channel());

    auto name = make_channel();
    name.set_name("updated channel");
    EXPECT_NE(hash(name), base);

    auto on = make_channel();
    on.set_on(false);
    EXPECT_NE(hash(on), base);

    auto width = make_channel();
    width.mutable_video_encoders(0)->set_width(1600);
    EXPECT_NE(hash(width), base);

    auto header = make_channel();
    (*header.mutable_publish_points(0)->mutable_headers())["X-Key"] = "v";
    EXPECT_NE(hash(header), base);

    auto tags = make_channel();
    tags.add_tags("event");
    EXPECT_NE(hash(tags), base);
}

TEST(HasherTest, DistinctValuesRarelyCollide) {
    std::set<std::string> seen;
    for (uint32_t i = 0; i < 1000; ++i) {
        auto ch = make_channel();
        ch.set_segment_duration(i);
        seen.insert(hash(ch));
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(HasherTest, StringValuesHashTheirBytes) {
    EXPECT_EQ(hash(std::string("abc")), hash_bytes("abc"));
}

} // namespace chandb::crypto
