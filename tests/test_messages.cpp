#include "network/messages.hpp"
#include "core/track/track.hpp"
#include <gtest/gtest.h>

using namespace dcmx;
using namespace dcmx::network;
using json = nlohmann::json;

class MessagesTest : public ::testing::Test {
protected:
    PeerRecord self{"self-id", "127.0.0.1", 9001};
    ContentHash h1 = core::Track::compute_hash(to_bytes("one"));
    ContentHash h2 = core::Track::compute_hash(to_bytes("two"));
};

TEST_F(MessagesTest, ParseBody) {
    EXPECT_TRUE(parse_body(R"({"status":"ok"})").is_ok());

    auto bad = parse_body("{oops");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code(), ErrorCode::ProtocolInvalidMessage);
}

TEST_F(MessagesTest, Ping) {
    json j = PingResponse{"ok", "self-id"}.to_json();
    EXPECT_EQ(j, (json{{"status", "ok"}, {"peer_id", "self-id"}}));

    auto parsed = PingResponse::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().peer_id, "self-id");

    EXPECT_TRUE(PingResponse::from_json(json{{"peer_id", "x"}}).is_err());
}

TEST_F(MessagesTest, DiscoverRequest) {
    self.add_content(h1);
    json j = DiscoverRequest{self}.to_json();
    ASSERT_TRUE(j["peer"].is_object());

    auto parsed = DiscoverRequest::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().peer.peer_id(), "self-id");
    EXPECT_TRUE(parsed.value().peer.has_content(h1));
}

TEST_F(MessagesTest, DiscoverRequestRejectsMalformed) {
    EXPECT_TRUE(DiscoverRequest::from_json(json::object()).is_err());
    EXPECT_TRUE(DiscoverRequest::from_json(json{{"peer", "self-id"}}).is_err());
    EXPECT_TRUE(DiscoverRequest::from_json(json{{"peer", {{"host", "h"}}}}).is_err());

    auto err = DiscoverRequest::from_json(json::array());
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.error().code(), ErrorCode::ProtocolInvalidMessage);
}

TEST_F(MessagesTest, DiscoverResponseWithHashes) {
    DiscoverResponse response{self, {h1, h2}};
    json j = response.to_json();
    EXPECT_EQ(j["tracks"], json::array({h1.to_string(), h2.to_string()}));

    auto parsed = DiscoverResponse::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().tracks, (std::vector<ContentHash>{h1, h2}));
}

TEST_F(MessagesTest, DiscoverResponseAcceptsTrackObjects) {
    core::TrackMetadata metadata;
    metadata.title = "t";
    metadata.artist = "a";
    auto track = core::Track::from_content(to_bytes("one"), metadata);

    json j = {{"peer", self.to_json()}, {"tracks", json::array({track.to_json(), h2.to_string()})}};
    auto parsed = DiscoverResponse::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().tracks, (std::vector<ContentHash>{h1, h2}));
}

TEST_F(MessagesTest, DiscoverResponseRejectsMalformed) {
    EXPECT_TRUE(DiscoverResponse::from_json(json{{"tracks", json::array()}}).is_err());
    EXPECT_TRUE(DiscoverResponse::from_json(
        json{{"peer", self.to_json()}, {"tracks", "h1"}}).is_err());
    EXPECT_TRUE(DiscoverResponse::from_json(
        json{{"peer", self.to_json()}, {"tracks", json::array({42})}}).is_err());

    // Missing track list means the peer serves nothing
    auto empty = DiscoverResponse::from_json(json{{"peer", self.to_json()}});
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().tracks.empty());
}

TEST_F(MessagesTest, PeersAndTracksResponses) {
    PeersResponse peers{{self, PeerRecord("other", "10.0.0.2", 9002)}};
    auto parsed_peers = PeersResponse::from_json(peers.to_json());
    ASSERT_TRUE(parsed_peers.is_ok());
    ASSERT_EQ(parsed_peers.value().peers.size(), 2u);
    EXPECT_EQ(parsed_peers.value().peers[1].peer_id(), "other");

    core::TrackMetadata metadata;
    metadata.title = "t";
    metadata.artist = "a";
    TracksResponse tracks{{core::Track::from_content(to_bytes("x"), metadata)}};
    auto parsed_tracks = TracksResponse::from_json(tracks.to_json());
    ASSERT_TRUE(parsed_tracks.is_ok());
    ASSERT_EQ(parsed_tracks.value().tracks.size(), 1u);
    EXPECT_EQ(parsed_tracks.value().tracks[0], tracks.tracks[0]);

    EXPECT_TRUE(PeersResponse::from_json(json::object()).is_err());
    EXPECT_TRUE(TracksResponse::from_json(json{{"tracks", json::array({json::object()})}}).is_err());
}

TEST_F(MessagesTest, ErrorResponse) {
    EXPECT_EQ(ErrorResponse{"Not found"}.to_json(), (json{{"error", "Not found"}}));

    auto parsed = ErrorResponse::from_json(json{{"error", "Invalid content hash"}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().error, "Invalid content hash");

    EXPECT_TRUE(ErrorResponse::from_json(json{{"error", 404}}).is_err());
    EXPECT_TRUE(ErrorResponse::from_json(json::array()).is_err());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
