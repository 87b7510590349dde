#include "core/track/track.hpp"
#include "dcmx/common.hpp"
#include <gtest/gtest.h>

using namespace dcmx;
using namespace dcmx::core;
using json = nlohmann::json;

class TrackTest : public ::testing::Test {
protected:
    bytes audio = to_bytes("fake mp3 frames");

    TrackMetadata make_metadata(const std::string& title) {
        TrackMetadata metadata;
        metadata.title = title;
        metadata.artist = "Test Artist";
        metadata.album = "Test Album";
        metadata.duration = 215;
        metadata.year = 2024;
        metadata.genre = "ambient";
        metadata.extra = json{{"bpm", 92}};
        return metadata;
    }
};

TEST_F(TrackTest, HashIsSha256OfBytes) {
    EXPECT_EQ(Track::compute_hash(to_bytes("abc")).to_string(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Track::compute_hash(audio), Track::compute_hash(audio));
}

TEST_F(TrackTest, FromContent) {
    Track track = Track::from_content(audio, make_metadata("Song"));

    EXPECT_EQ(track.title(), "Song");
    EXPECT_EQ(track.artist(), "Test Artist");
    EXPECT_EQ(track.size(), audio.size());
    EXPECT_EQ(track.format(), "mp3");
    EXPECT_EQ(track.content_hash(), Track::compute_hash(audio));
    EXPECT_FALSE(track.timestamp().empty());
}

TEST_F(TrackTest, MetadataIndependence) {
    Track a = Track::from_content(audio, make_metadata("Title A"));
    Track b = Track::from_content(audio, make_metadata("Title B"));

    EXPECT_EQ(a.content_hash(), b.content_hash());
    EXPECT_NE(a, b);
}

TEST_F(TrackTest, Verify) {
    Track track = Track::from_content(audio, make_metadata("Song"));
    EXPECT_TRUE(track.verify(audio));

    bytes tampered = audio;
    tampered[0] ^= 0x01;
    EXPECT_FALSE(track.verify(tampered));
    EXPECT_FALSE(track.verify(bytes{}));
}

TEST_F(TrackTest, JsonTransportForm) {
    Track track = Track::from_content(audio, make_metadata("Song"));
    json j = track.to_json();

    EXPECT_EQ(j["title"], "Song");
    EXPECT_EQ(j["content_hash"], track.content_hash().to_string());
    EXPECT_EQ(j["size"], audio.size());
    EXPECT_EQ(j["duration"], 215);
    EXPECT_EQ(j["year"], 2024);
    EXPECT_EQ(j["metadata"]["bpm"], 92);

    auto parsed = Track::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), track);
}

TEST_F(TrackTest, OptionalFieldsSerializeAsNull) {
    TrackMetadata metadata;
    metadata.title = "Bare";
    metadata.artist = "Nobody";

    Track track = Track::from_content(audio, metadata);
    json j = track.to_json();
    EXPECT_TRUE(j["album"].is_null());
    EXPECT_TRUE(j["year"].is_null());
    EXPECT_TRUE(j["genre"].is_null());

    auto parsed = Track::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_FALSE(parsed.value().album().has_value());
    EXPECT_EQ(parsed.value(), track);
}

TEST_F(TrackTest, FromJsonRejectsMissingFields) {
    json j = Track::from_content(audio, make_metadata("Song")).to_json();

    for (const char* key : {"title", "artist", "content_hash", "duration", "size"}) {
        json broken = j;
        broken.erase(key);
        auto parsed = Track::from_json(broken);
        ASSERT_TRUE(parsed.is_err()) << "accepted track without " << key;
        EXPECT_EQ(parsed.error().code(), ErrorCode::DeserializationFailed);
    }
}

TEST_F(TrackTest, FromJsonRejectsBadTypes) {
    json j = Track::from_content(audio, make_metadata("Song")).to_json();

    json bad_hash = j;
    bad_hash["content_hash"] = "abc";
    EXPECT_TRUE(Track::from_json(bad_hash).is_err());

    json negative_size = j;
    negative_size["size"] = -1;
    EXPECT_TRUE(Track::from_json(negative_size).is_err());

    json string_duration = j;
    string_duration["duration"] = "215";
    EXPECT_TRUE(Track::from_json(string_duration).is_err());

    EXPECT_TRUE(Track::from_json(json::array()).is_err());
}

TEST_F(TrackTest, ToString) {
    Track track = Track::from_content(audio, make_metadata("Song"));
    EXPECT_EQ(track.to_string(), "Test Artist - Song (mp3, 215s)");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
