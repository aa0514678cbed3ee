#include <ulidkit/timestamp.hpp>
#include <ulidkit/base32.hpp>
#include <chrono>
#include <cstdio>

namespace ulidkit {

Status check_time(int64_t ms) {
    if (ms < 0 || ms > kTimeMax) {
        return UlidError(UlidError::TimeRange,
            "timestamp " + std::to_string(ms) + " is outside the ULID range",
            "expected milliseconds in [0, " + std::to_string(kTimeMax) + "]");
    }
    return ok_status();
}

Result<std::string> encode_time(int64_t ms) {
    ULIDKIT_TRY(check_time(ms));
    return base32::encode_int(static_cast<uint64_t>(ms), kTimeLen);
}

Result<uint64_t> decode_time(const std::string& field) {
    if (field.size() != kTimeLen) {
        return UlidError(UlidError::InvalidLength,
            "time field must be " + std::to_string(kTimeLen) + " characters",
            "got " + std::to_string(field.size()) + " characters");
    }
    return base32::decode_int(field);
}

int64_t now_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// ---- Calendar ----
// Days since 1970-01-01 to (year, month, day); era-based, valid for all
// non-negative inputs the 48-bit range can produce.

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = z / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

std::string format_iso8601(uint64_t ms) {
    const uint64_t ms_per_day = 86400000ULL;
    int64_t days = static_cast<int64_t>(ms / ms_per_day);
    uint64_t rem = ms % ms_per_day;

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    unsigned hour = static_cast<unsigned>(rem / 3600000);
    unsigned minute = static_cast<unsigned>(rem / 60000 % 60);
    unsigned second = static_cast<unsigned>(rem / 1000 % 60);
    unsigned milli = static_cast<unsigned>(rem % 1000);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  static_cast<long long>(year), month, day, hour, minute, second, milli);
    return buf;
}

} // namespace ulidkit
