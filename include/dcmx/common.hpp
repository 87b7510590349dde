#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// DCMX Node Version
#define DCMX_VERSION_MAJOR 0
#define DCMX_VERSION_MINOR 1
#define DCMX_VERSION_PATCH 0
#define DCMX_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef DCMX_PLATFORM_WINDOWS
        #define DCMX_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef DCMX_PLATFORM_LINUX
        #define DCMX_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef DCMX_PLATFORM_MACOS
        #define DCMX_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define DCMX_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define DCMX_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define DCMX_DISALLOW_COPY_AND_MOVE(TypeName) \
    DCMX_DISALLOW_COPY(TypeName); \
    DCMX_DISALLOW_MOVE(TypeName)

// Constants
namespace dcmx {
namespace constants {

// Network constants
constexpr uint16_t DEFAULT_PORT = 8080;
constexpr const char* DEFAULT_HOST = "127.0.0.1";
constexpr size_t MAX_MESSAGE_SIZE = 10 * 1024 * 1024;     // 10 MB (JSON payloads)
constexpr size_t MAX_CONTENT_SIZE = 500 * 1024 * 1024;    // 500 MB (raw track bytes)

// Outbound timeouts
constexpr uint32_t CONNECT_TIMEOUT_SECONDS = 5;
constexpr uint32_t DISCOVERY_TIMEOUT_SECONDS = 10;
constexpr uint32_t PING_TIMEOUT_SECONDS = 5;
constexpr uint32_t CONTENT_TIMEOUT_SECONDS = 60;

// Cryptography constants
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t PEER_ID_RANDOM_BYTES = 16;

// Storage constants
constexpr size_t SHARD_PREFIX_LENGTH = 2;

} // namespace constants
} // namespace dcmx

// Core types
namespace dcmx {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

/**
 * Content address: SHA-256 digest of raw content bytes
 */
struct ContentHash {
    Hash256 hash{};

    ContentHash() = default;
    explicit ContentHash(const Hash256& h) : hash(h) {}

    /**
     * Lowercase hex rendering (64 characters)
     */
    std::string to_string() const;

    /**
     * Parse from hex; throws std::invalid_argument on malformed input
     */
    static ContentHash from_string(const std::string& str);

    /**
     * Parse from hex without throwing
     */
    static std::optional<ContentHash> parse(const std::string& str);

    bool operator==(const ContentHash& other) const { return hash == other.hash; }
    bool operator!=(const ContentHash& other) const { return hash != other.hash; }
    bool operator<(const ContentHash& other) const { return hash < other.hash; }
};

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);
bool is_hex_hash(const std::string& hex);

std::string to_string(const bytes& data);
bytes to_bytes(const std::string& str);

} // namespace dcmx

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<dcmx::Hash256> {
    size_t operator()(const dcmx::Hash256& h) const noexcept {
        // Hash first 8 bytes
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < h.size(); ++i) {
            result = (result << 8) | h[i];
        }
        return result;
    }
};

template<>
struct hash<dcmx::ContentHash> {
    size_t operator()(const dcmx::ContentHash& h) const noexcept {
        return hash<dcmx::Hash256>()(h.hash);
    }
};
} // namespace std
