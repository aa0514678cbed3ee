#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidkit {

// Symbols in the random field of a ULID: 80 bits.
inline constexpr size_t kRandomLen = 16;

// Fills buf from /dev/urandom. If the device cannot be read, falls back to a
// std::random_device-seeded mt19937_64 and warns once per process: that
// degraded mode is not suitable where unpredictability matters.
void fill_random_bytes(uint8_t* buf, size_t len);

// True once fill_random_bytes has had to use the fallback generator.
bool random_source_degraded();

// `width` independent symbols, each uniform over the base32 alphabet.
std::string encode_random(size_t width);

} // namespace ulidkit
