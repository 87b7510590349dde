#include "dcmx/common.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace dcmx {

namespace {
    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

// Utility functions
std::string hash_to_hex(const Hash256& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : hash) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

bool is_hex_hash(const std::string& hex) {
    if (hex.length() != Hash256().size() * 2) {
        return false;
    }
    for (char c : hex) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

Hash256 hex_to_hash(const std::string& hex) {
    if (!is_hex_hash(hex)) {
        throw std::invalid_argument("Invalid hex hash: " + hex);
    }
    Hash256 hash;
    for (size_t i = 0; i < hash.size(); ++i) {
        hash[i] = static_cast<byte>((hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]));
    }
    return hash;
}

std::string to_string(const bytes& data) {
    return std::string(data.begin(), data.end());
}

bytes to_bytes(const std::string& str) {
    return bytes(str.begin(), str.end());
}

// ContentHash implementation
std::string ContentHash::to_string() const {
    return hash_to_hex(hash);
}

ContentHash ContentHash::from_string(const std::string& str) {
    return ContentHash(hex_to_hash(str));
}

std::optional<ContentHash> ContentHash::parse(const std::string& str) {
    if (!is_hex_hash(str)) {
        return std::nullopt;
    }
    return ContentHash(hex_to_hash(str));
}

} // namespace dcmx
