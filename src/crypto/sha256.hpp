#pragma once

#include "dcmx/common.hpp"
#include <sodium.h>
#include <string>

namespace dcmx::crypto {

/**
 * SHA-256 hash function wrapper (libsodium)
 */
class Sha256 {
public:
    /**
     * Hash data in one shot
     * @param data The data to hash
     * @return 32-byte digest
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a string's raw bytes
     */
    static Hash256 hash(const std::string& str);

    /**
     * Hash a raw buffer
     */
    static Hash256 hash(const byte* data, size_t len);

    /**
     * Incremental hashing for payloads read in chunks
     */
    Sha256();
    void update(const byte* data, size_t len);
    void update(const bytes& data);
    Hash256 finalize();

private:
    crypto_hash_sha256_state state_;
    bool finalized_{false};
};

} // namespace dcmx::crypto
