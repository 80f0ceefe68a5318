/**
 * vidyeet - Randomness and secret-handling helpers built on libsodium.
 */
#pragma once

#include <cstdint>
#include <string>

namespace vidyeet::crypto
{

    // Uniformly distributed value in [0, upper_bound). Returns 0 when upper_bound is 0.
    std::uint32_t random_uniform(std::uint32_t upper_bound);

    // Overwrites the buffer contents before releasing them.
    void secure_wipe(std::string &secret);

} // namespace vidyeet::crypto
