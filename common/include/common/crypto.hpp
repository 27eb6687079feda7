#pragma once

#include <cstddef>
#include <string>

namespace livequiz {

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
// Throws std::runtime_error if the generator is not seeded.
std::string random_hex_id(std::size_t bytes = 8);

// Message id attached to QUESTION broadcasts ("M-" + 12 hex chars).
std::string new_message_id();

}  // namespace livequiz
