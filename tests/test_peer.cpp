#include "network/peer.hpp"
#include "core/track/track.hpp"
#include "dcmx/time_utils.hpp"
#include <gtest/gtest.h>

using namespace dcmx;
using namespace dcmx::network;
using json = nlohmann::json;

namespace {
    ContentHash hash_of(const std::string& text) {
        return core::Track::compute_hash(to_bytes(text));
    }
}

TEST(PeerRecordTest, GeneratesUniqueIds) {
    PeerRecord a("127.0.0.1", 9001);
    PeerRecord b("127.0.0.1", 9001);

    EXPECT_EQ(a.peer_id().size(), 36u);
    EXPECT_NE(a.peer_id(), b.peer_id());
    EXPECT_NE(a, b);
    EXPECT_EQ(a.address(), "127.0.0.1:9001");
}

TEST(PeerRecordTest, ContentBookkeeping) {
    PeerRecord peer("10.0.0.1", 8080);
    auto h1 = hash_of("one");
    auto h2 = hash_of("two");

    peer.add_content(h1);
    peer.add_content(h1);
    peer.add_content(h2);
    EXPECT_EQ(peer.available_content().size(), 2u);
    EXPECT_TRUE(peer.has_content(h1));

    peer.remove_content(h1);
    EXPECT_FALSE(peer.has_content(h1));
    EXPECT_TRUE(peer.has_content(h2));

    // Removing something absent is harmless
    peer.remove_content(h1);
    EXPECT_EQ(peer.available_content().size(), 1u);
}

TEST(PeerRecordTest, TouchAndStaleness) {
    PeerRecord peer("10.0.0.1", 8080);
    peer.set_last_seen(time::now() - std::chrono::hours(2));

    EXPECT_TRUE(peer.is_stale(std::chrono::hours(1)));

    auto before = peer.last_seen();
    peer.touch();
    EXPECT_GT(peer.last_seen(), before);
    EXPECT_FALSE(peer.is_stale(std::chrono::hours(1)));
}

TEST(PeerRecordTest, JsonRoundTrip) {
    PeerRecord peer("peer-1", "192.168.1.5", 9002);
    peer.add_content(hash_of("a"));
    peer.add_content(hash_of("b"));
    peer.set_metadata(json{{"client", "dcmx"}});

    json j = peer.to_json();
    EXPECT_EQ(j["peer_id"], "peer-1");
    EXPECT_EQ(j["port"], 9002);
    EXPECT_EQ(j["available_tracks"].size(), 2u);
    EXPECT_TRUE(j["last_seen"].is_string());

    auto parsed = PeerRecord::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    const auto& back = parsed.value();
    EXPECT_EQ(back.peer_id(), "peer-1");
    EXPECT_EQ(back.host(), "192.168.1.5");
    EXPECT_EQ(back.port(), 9002);
    EXPECT_EQ(back.available_content(), peer.available_content());
    EXPECT_EQ(back.last_seen(), peer.last_seen());
    EXPECT_EQ(back.metadata()["client"], "dcmx");
}

TEST(PeerRecordTest, FromJsonDefaultsOptionalFields) {
    auto parsed = PeerRecord::from_json(json{{"peer_id", "p"}, {"host", "h"}, {"port", 1}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().available_content().empty());
    EXPECT_TRUE(parsed.value().metadata().is_object());
}

TEST(PeerRecordTest, FromJsonRejectsMalformed) {
    const json valid = {{"peer_id", "p"}, {"host", "h"}, {"port", 8080}};

    for (const char* key : {"peer_id", "host", "port"}) {
        json broken = valid;
        broken.erase(key);
        auto parsed = PeerRecord::from_json(broken);
        ASSERT_TRUE(parsed.is_err()) << "accepted peer without " << key;
        EXPECT_EQ(parsed.error().code(), ErrorCode::DeserializationFailed);
    }

    json bad_port = valid;
    bad_port["port"] = 70000;
    EXPECT_TRUE(PeerRecord::from_json(bad_port).is_err());

    json bad_tracks = valid;
    bad_tracks["available_tracks"] = json::array({"not-a-hash"});
    EXPECT_TRUE(PeerRecord::from_json(bad_tracks).is_err());

    json bad_time = valid;
    bad_time["last_seen"] = "last tuesday";
    EXPECT_TRUE(PeerRecord::from_json(bad_time).is_err());

    EXPECT_TRUE(PeerRecord::from_json(json("peer")).is_err());
}

TEST(PeerRecordTest, ToString) {
    PeerRecord peer("1a2b3c4d-0000-4000-8000-000000000000", "127.0.0.1", 9001);
    EXPECT_EQ(peer.to_string(), "Peer(1a2b3c4d... @ 127.0.0.1:9001)");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
