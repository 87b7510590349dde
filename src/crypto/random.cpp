#include "random.hpp"
#include <sodium.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace dcmx::crypto {

void ensure_sodium_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    });
}

bytes Random::generate(size_t size) {
    ensure_sodium_initialized();
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

uint32_t Random::generate_uint32() {
    ensure_sodium_initialized();
    return randombytes_random();
}

uint32_t Random::uniform(uint32_t upper_bound) {
    ensure_sodium_initialized();
    return randombytes_uniform(upper_bound);
}

std::string Random::uuid_v4() {
    auto raw = generate(constants::PEER_ID_RANDOM_BYTES);

    // RFC 4122: version 4, variant 10xx
    raw[6] = static_cast<byte>((raw[6] & 0x0f) | 0x40);
    raw[8] = static_cast<byte>((raw[8] & 0x3f) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(raw[i]);
    }
    return oss.str();
}

} // namespace dcmx::crypto
