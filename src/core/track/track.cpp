#include "track.hpp"
#include "dcmx/time_utils.hpp"
#include "crypto/sha256.hpp"
#include <sstream>

namespace dcmx::core {

using json = nlohmann::json;

namespace {
    Result<Track> reject(const std::string& reason) {
        return Result<Track>::Err(ErrorCode::DeserializationFailed,
            "invalid track record", reason);
    }

    template<typename T>
    json optional_to_json(const std::optional<T>& value) {
        return value ? json(*value) : json(nullptr);
    }
}

Track::Track(TrackMetadata metadata, ContentHash content_hash, uint64_t size)
    : metadata_(std::move(metadata))
    , content_hash_(content_hash)
    , size_(size)
{
    if (!metadata_.timestamp) {
        metadata_.timestamp = time::to_string(time::now());
    }
    if (metadata_.extra.is_null()) {
        metadata_.extra = json::object();
    }
}

ContentHash Track::compute_hash(const bytes& data) {
    return ContentHash(crypto::Sha256::hash(data));
}

Track Track::from_content(const bytes& data, TrackMetadata metadata) {
    return Track(std::move(metadata), compute_hash(data), data.size());
}

bool Track::verify(const bytes& data) const {
    return data.size() == size_ && compute_hash(data) == content_hash_;
}

json Track::to_json() const {
    return json{
        {"title", metadata_.title},
        {"artist", metadata_.artist},
        {"content_hash", content_hash_.to_string()},
        {"duration", metadata_.duration},
        {"size", size_},
        {"format", metadata_.format},
        {"album", optional_to_json(metadata_.album)},
        {"year", optional_to_json(metadata_.year)},
        {"genre", optional_to_json(metadata_.genre)},
        {"metadata", metadata_.extra},
        {"timestamp", *metadata_.timestamp}
    };
}

Result<Track> Track::from_json(const json& j) {
    if (!j.is_object()) {
        return reject("track must be a JSON object");
    }

    for (const char* key : {"title", "artist", "content_hash"}) {
        if (!j.contains(key) || !j.at(key).is_string()) {
            return reject(std::string("missing or non-string field '") + key + "'");
        }
    }
    for (const char* key : {"duration", "size"}) {
        if (!j.contains(key) || !j.at(key).is_number_integer()) {
            return reject(std::string("missing or non-integer field '") + key + "'");
        }
        if (!j.at(key).is_number_unsigned() && j.at(key).get<int64_t>() < 0) {
            return reject(std::string("negative field '") + key + "'");
        }
    }

    auto hash = ContentHash::parse(j.at("content_hash").get<std::string>());
    if (!hash) {
        return reject("content_hash is not a 64-character hex digest");
    }

    TrackMetadata metadata;
    metadata.title = j.at("title").get<std::string>();
    metadata.artist = j.at("artist").get<std::string>();

    uint64_t duration = j.at("duration").get<uint64_t>();
    if (duration > UINT32_MAX) {
        return reject("duration out of range");
    }
    metadata.duration = static_cast<uint32_t>(duration);

    auto optional_string = [&j](const char* key, std::optional<std::string>& out) -> bool {
        if (!j.contains(key) || j.at(key).is_null()) return true;
        if (!j.at(key).is_string()) return false;
        out = j.at(key).get<std::string>();
        return true;
    };

    std::optional<std::string> format;
    if (!optional_string("format", format)) return reject("format must be a string");
    if (format) metadata.format = *format;

    if (!optional_string("album", metadata.album)) return reject("album must be a string");
    if (!optional_string("genre", metadata.genre)) return reject("genre must be a string");
    if (!optional_string("timestamp", metadata.timestamp)) return reject("timestamp must be a string");

    if (j.contains("year") && !j.at("year").is_null()) {
        if (!j.at("year").is_number_integer()) {
            return reject("year must be an integer");
        }
        metadata.year = j.at("year").get<int32_t>();
    }

    if (j.contains("metadata") && !j.at("metadata").is_null()) {
        if (!j.at("metadata").is_object()) {
            return reject("metadata must be an object");
        }
        metadata.extra = j.at("metadata");
    }

    return Result<Track>::Ok(Track(std::move(metadata), *hash, j.at("size").get<uint64_t>()));
}

std::string Track::to_string() const {
    std::ostringstream oss;
    oss << metadata_.artist << " - " << metadata_.title
        << " (" << metadata_.format << ", " << metadata_.duration << "s)";
    return oss.str();
}

bool Track::operator==(const Track& other) const {
    return content_hash_ == other.content_hash_ &&
           size_ == other.size_ &&
           metadata_.title == other.metadata_.title &&
           metadata_.artist == other.metadata_.artist &&
           metadata_.album == other.metadata_.album &&
           metadata_.duration == other.metadata_.duration &&
           metadata_.format == other.metadata_.format &&
           metadata_.year == other.metadata_.year &&
           metadata_.genre == other.metadata_.genre &&
           metadata_.extra == other.metadata_.extra &&
           metadata_.timestamp == other.metadata_.timestamp;
}

} // namespace dcmx::core
