#pragma once

#include "dcmx/common.hpp"
#include <string>

namespace dcmx::crypto {

/**
 * Initialize libsodium once per process; throws std::runtime_error on failure
 */
void ensure_sodium_initialized();

/**
 * Random number generation (CSPRNG)
 */
class Random {
public:
    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     */
    static bytes generate(size_t size);

    /**
     * Generate random 32-bit integer
     */
    static uint32_t generate_uint32();

    /**
     * Generate uniform random integer in range [0, upper_bound)
     */
    static uint32_t uniform(uint32_t upper_bound);

    /**
     * Random (version 4) UUID in canonical 8-4-4-4-12 form
     */
    static std::string uuid_v4();
};

} // namespace dcmx::crypto
