#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

namespace dcmx::core {

/**
 * TrackMetadata - Descriptive fields supplied when content is ingested
 */
struct TrackMetadata {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    uint32_t duration{0};                    // Seconds
    std::string format{"mp3"};               // Audio container/codec
    std::optional<int32_t> year;
    std::optional<std::string> genre;
    nlohmann::json extra = nlohmann::json::object();
    std::optional<std::string> timestamp;    // ISO 8601; defaults to creation time
};

/**
 * Track - Immutable record describing one stored audio object
 *
 * The content hash covers the raw bytes only, so byte-identical payloads
 * share an address whatever their metadata says.
 */
class Track {
public:
    Track(TrackMetadata metadata, ContentHash content_hash, uint64_t size);

    /**
     * SHA-256 of raw content bytes
     */
    static ContentHash compute_hash(const bytes& data);

    /**
     * Build a record for a payload: hashes it and takes its size
     */
    static Track from_content(const bytes& data, TrackMetadata metadata);

    /**
     * Check that data is the payload this record addresses
     */
    bool verify(const bytes& data) const;

    /**
     * Transport form
     */
    nlohmann::json to_json() const;

    /**
     * Parse the transport form; rejects missing or mistyped fields
     */
    static Result<Track> from_json(const nlohmann::json& j);

    const std::string& title() const { return metadata_.title; }
    const std::string& artist() const { return metadata_.artist; }
    const std::optional<std::string>& album() const { return metadata_.album; }
    uint32_t duration() const { return metadata_.duration; }
    uint64_t size() const { return size_; }
    const std::string& format() const { return metadata_.format; }
    const std::optional<int32_t>& year() const { return metadata_.year; }
    const std::optional<std::string>& genre() const { return metadata_.genre; }
    const nlohmann::json& extra() const { return metadata_.extra; }
    const std::string& timestamp() const { return *metadata_.timestamp; }
    const ContentHash& content_hash() const { return content_hash_; }
    const TrackMetadata& metadata() const { return metadata_; }

    /**
     * "artist - title (format, Ns)"
     */
    std::string to_string() const;

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

private:
    TrackMetadata metadata_;
    ContentHash content_hash_;
    uint64_t size_;
};

} // namespace dcmx::core
