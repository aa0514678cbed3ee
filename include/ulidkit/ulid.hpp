#pragma once

#include <ulidkit/monotonic.hpp>
#include <ulidkit/random.hpp>
#include <ulidkit/result.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ulidkit {

inline constexpr size_t kUlidLen = 26;

// Millisecond-resolution wall-clock instant. The nanosecond
// system_clock::time_point cannot reach the top of the 48-bit range.
using UlidTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// How parse() treats input case. The defaults accept lower-case input but
// leave I, L and O as errors.
struct ParseOptions {
    bool case_insensitive = true;
    bool remap_ambiguous = false;   // I/L -> 1, O -> 0; implies case_insensitive
};

struct ParseResult {
    std::string ulid;               // canonical (normalized) form
    std::string timestamp_part;
    std::string randomness_part;
    uint64_t timestamp = 0;
    UlidTime date;

    // date as "2022-01-01T00:00:00.000Z"
    std::string date_string() const;
};

// 128-bit big-endian form: bytes 0..5 time, 6..15 randomness.
using UlidBytes = std::array<uint8_t, 16>;

// Current time, fresh randomness.
Result<GenerationResult> generate_standard();

// `seed_time` (or now), fresh randomness on every call. Results sharing a
// seed have the same time field and no ordering among themselves.
Result<GenerationResult> generate_seeded(std::optional<int64_t> seed_time = std::nullopt);

// Monotonic generation on `seq`. With a seed this is
// seq.generate_pinned(seed): a seed that differs from the sequencer's default
// resets it first, and later seedless calls keep counting from that seed.
Result<GenerationResult> generate_monotonic(MonotonicSequencer& seq,
                                            std::optional<int64_t> seed_time = std::nullopt);

// Same, on default_sequencer().
Result<GenerationResult> generate_monotonic(std::optional<int64_t> seed_time = std::nullopt);

// Process-wide sequencer shared by every caller that does not own one.
MonotonicSequencer& default_sequencer();

// Err(InvalidLength) unless 26 characters, Err(InvalidCharacter) for a
// symbol outside the alphabet after normalization.
Result<ParseResult> parse(const std::string& s, const ParseOptions& options = {});

// parse() rules, plus Err(Range) when the value needs more than 128 bits
// (first symbol above '7').
Result<UlidBytes> to_bytes(const std::string& s, const ParseOptions& options = {});
std::string from_bytes(const UlidBytes& bytes);

} // namespace ulidkit
