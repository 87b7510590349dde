#include "sha256.hpp"
#include "random.hpp"
#include <stdexcept>

namespace dcmx::crypto {

Hash256 Sha256::hash(const bytes& data) {
    return hash(data.data(), data.size());
}

Hash256 Sha256::hash(const std::string& str) {
    return hash(reinterpret_cast<const byte*>(str.data()), str.size());
}

Hash256 Sha256::hash(const byte* data, size_t len) {
    ensure_sodium_initialized();

    Hash256 result;
    crypto_hash_sha256(result.data(), data, static_cast<unsigned long long>(len));
    return result;
}

Sha256::Sha256() {
    ensure_sodium_initialized();
    crypto_hash_sha256_init(&state_);
}

void Sha256::update(const byte* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("Sha256::update called after finalize");
    }
    crypto_hash_sha256_update(&state_, data, static_cast<unsigned long long>(len));
}

void Sha256::update(const bytes& data) {
    update(data.data(), data.size());
}

Hash256 Sha256::finalize() {
    if (finalized_) {
        throw std::logic_error("Sha256::finalize called twice");
    }
    Hash256 result;
    crypto_hash_sha256_final(&state_, result.data());
    finalized_ = true;
    return result;
}

} // namespace dcmx::crypto
