#pragma once

#include <ulidkit/result.hpp>
#include <cstdint>
#include <string>

namespace ulidkit {

// Largest timestamp a ULID can carry: 2^48 - 1 ms, some time in year 10889.
inline constexpr int64_t kTimeMax = (int64_t{1} << 48) - 1;
inline constexpr size_t kTimeLen = 10;

// Err(TimeRange) unless 0 <= ms <= kTimeMax.
Status check_time(int64_t ms);

// 10-symbol time field. Err(TimeRange) for out-of-range input.
Result<std::string> encode_time(int64_t ms);

// Err(InvalidLength) unless 10 symbols; otherwise base32::decode_int().
// The result may exceed kTimeMax: symbols above '7' in the first position
// are accepted here and only rejected by the binary conversion.
Result<uint64_t> decode_time(const std::string& field);

// Milliseconds since the Unix epoch from the system clock.
int64_t now_ms();

// "YYYY-MM-DDTHH:MM:SS.mmmZ", proleptic Gregorian, UTC.
std::string format_iso8601(uint64_t ms);

} // namespace ulidkit
