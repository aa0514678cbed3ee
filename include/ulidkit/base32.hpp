#pragma once

#include <ulidkit/result.hpp>
#include <cstdint>
#include <string>

namespace ulidkit::base32 {

// Crockford's alphabet: digits and upper-case letters minus I, L, O and U.
inline constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr int kRadix = 32;

// Widest field decode_int() accepts: 12 symbols = 60 bits.
inline constexpr size_t kMaxDecodeWidth = 12;

// Index of `c` in kAlphabet, or -1. Exact match only: 'a' is not 'A'.
int symbol_index(char c);
bool is_valid_symbol(char c);

// Fixed-width big-endian encoding, left-padded with '0'.
// Err(Range) when value needs more than `width` symbols.
Result<std::string> encode_int(uint64_t value, size_t width);

// Left fold acc * 32 + index(c).
// Err(InvalidCharacter) on a symbol outside the alphabet,
// Err(Range) when s is wider than kMaxDecodeWidth.
Result<uint64_t> decode_int(const std::string& s);

// Adds one to `s` read as a big-endian base-32 counter.
//
// When every digit is already 'Z' the counter has no room left; instead of
// failing, a fresh random string of the same width is returned. That breaks
// ordering against the previous value, which is accepted in exchange for
// never refusing to mint an identifier. The event is logged at warn level.
Result<std::string> increment_digits(const std::string& s);

// Upper-cases `s`. With remap_ambiguous, also applies the Crockford decode
// aliases I/L -> 1 and O -> 0. Symbols that stay invalid (U, punctuation)
// are left for the decoder to reject.
std::string normalize(const std::string& s, bool remap_ambiguous);

} // namespace ulidkit::base32
