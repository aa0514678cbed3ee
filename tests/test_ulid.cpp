#include <catch2/catch.hpp>
#include <ulidkit/base32.hpp>
#include <ulidkit/timestamp.hpp>
#include <ulidkit/ulid.hpp>
#include <set>
#include <string>

using namespace ulidkit;

static const int64_t kSeed = 1640995200000;      // 2022-01-01T00:00:00Z

static bool all_symbols_valid(const std::string& s) {
    for (char c : s) {
        if (!base32::is_valid_symbol(c)) return false;
    }
    return true;
}

// ===== generate_standard =====

TEST_CASE("standard ULID shape", "[ulid]") {
    int64_t before = now_ms();
    auto r = generate_standard();
    int64_t after = now_ms();
    REQUIRE(r.is_ok());
    const auto& g = r.value();
    REQUIRE(g.ulid.size() == kUlidLen);
    REQUIRE(g.randomness.size() == kRandomLen);
    REQUIRE(g.ulid.substr(10) == g.randomness);
    REQUIRE(all_symbols_valid(g.ulid));
    REQUIRE(g.timestamp >= static_cast<uint64_t>(before));
    REQUIRE(g.timestamp <= static_cast<uint64_t>(after));
    REQUIRE(decode_time(g.ulid.substr(0, 10)).value() == g.timestamp);
}

TEST_CASE("1000 standard ULIDs are distinct", "[ulid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        auto r = generate_standard();
        REQUIRE(r.is_ok());
        REQUIRE(seen.insert(r.value().ulid).second);
    }
}

// ===== generate_seeded =====

TEST_CASE("seeded ULID uses the seed time", "[ulid]") {
    auto r = generate_seeded(kSeed);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().timestamp == static_cast<uint64_t>(kSeed));
    REQUIRE(r.value().ulid.substr(0, 10) == "01FR9EZ700");
    REQUIRE(r.value().randomness.size() == 16);
}

TEST_CASE("same seed gives different randomness", "[ulid]") {
    auto a = generate_seeded(kSeed).value();
    auto b = generate_seeded(kSeed).value();
    REQUIRE(a.timestamp == b.timestamp);
    REQUIRE(a.randomness != b.randomness);
    REQUIRE(a.ulid != b.ulid);
}

TEST_CASE("seeded without seed uses the current time", "[ulid]") {
    int64_t before = now_ms();
    auto r = generate_seeded().value();
    REQUIRE(r.timestamp >= static_cast<uint64_t>(before));
    REQUIRE(r.timestamp <= static_cast<uint64_t>(now_ms()));
}

TEST_CASE("seed zero is a real timestamp", "[ulid]") {
    auto r = generate_seeded(0).value();
    REQUIRE(r.timestamp == 0);
    REQUIRE(r.ulid.substr(0, 10) == "0000000000");
}

TEST_CASE("seeded rejects out-of-range seeds", "[ulid]") {
    auto neg = generate_seeded(-1);
    REQUIRE(neg.is_err());
    REQUIRE(neg.error().code == UlidError::TimeRange);

    auto big = generate_seeded(kTimeMax + 1);
    REQUIRE(big.is_err());
    REQUIRE(big.error().code == UlidError::TimeRange);

    REQUIRE(generate_seeded(kTimeMax).value().ulid.substr(0, 10) == "7ZZZZZZZZZ");
}

// ===== generate_monotonic =====

TEST_CASE("monotonic on a caller-owned sequencer", "[ulid]") {
    MonotonicSequencer seq;
    auto a = generate_monotonic(seq, kSeed).value();
    auto b = generate_monotonic(seq, kSeed).value();
    auto c = generate_monotonic(seq).value();
    REQUIRE(a.timestamp == static_cast<uint64_t>(kSeed));
    REQUIRE(b.ulid > a.ulid);
    REQUIRE(c.ulid > b.ulid);
    REQUIRE(c.timestamp == static_cast<uint64_t>(kSeed));
}

TEST_CASE("monotonic on the default sequencer", "[ulid]") {
    auto a = generate_monotonic(kSeed).value();
    auto b = generate_monotonic(kSeed).value();
    REQUIRE(b.ulid > a.ulid);
    REQUIRE(default_sequencer().last_random() == b.randomness);

    const int64_t next_day = 1641081600000;
    auto c = generate_monotonic(next_day).value();
    REQUIRE(c.timestamp == static_cast<uint64_t>(next_day));

    default_sequencer().reset();
}

TEST_CASE("monotonic rejects a bad seed and keeps counting", "[ulid]") {
    MonotonicSequencer seq;
    auto a = generate_monotonic(seq, kSeed).value();
    auto bad = generate_monotonic(seq, -1);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == UlidError::TimeRange);
    auto b = generate_monotonic(seq, kSeed).value();
    REQUIRE(b.ulid > a.ulid);
}

// ===== parse =====

TEST_CASE("parse known ULID", "[ulid][parse]") {
    auto r = parse("01FR9EZ700RPB9GR0NVWG3MYFY");
    REQUIRE(r.is_ok());
    const auto& p = r.value();
    REQUIRE(p.ulid == "01FR9EZ700RPB9GR0NVWG3MYFY");
    REQUIRE(p.timestamp_part == "01FR9EZ700");
    REQUIRE(p.randomness_part == "RPB9GR0NVWG3MYFY");
    REQUIRE(p.timestamp == 1640995200000ULL);
    REQUIRE(p.date.time_since_epoch().count() == 1640995200000LL);
    REQUIRE(p.date_string() == "2022-01-01T00:00:00.000Z");
}

TEST_CASE("parse inverts generation", "[ulid][parse]") {
    auto g = generate_standard().value();
    auto p = parse(g.ulid).value();
    REQUIRE(p.ulid == g.ulid);
    REQUIRE(p.timestamp == g.timestamp);
    REQUIRE(p.randomness_part == g.randomness);
}

TEST_CASE("parse rejects wrong length", "[ulid][parse]") {
    for (const char* bad : {"invalid", "", "01FN2GZJZK000000000000000000000",
                            "01FR9EZ700RPB9GR0NVWG3MYF"}) {
        auto r = parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UlidError::InvalidLength);
    }
}

TEST_CASE("parse rejects excluded letters", "[ulid][parse]") {
    for (const char* bad : {"01FR9EZ700RPB9GR0NVWG3MYFU",
                            "U1FR9EZ700RPB9GR0NVWG3MYFY",
                            "01FR9EZ700RPB9GR0NVWG3MY-Y"}) {
        auto r = parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UlidError::InvalidCharacter);
    }
}

TEST_CASE("parse accepts lower case by default", "[ulid][parse]") {
    auto r = parse("01fr9ez700rpb9gr0nvwg3myfy");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().ulid == "01FR9EZ700RPB9GR0NVWG3MYFY");
    REQUIRE(r.value().timestamp == 1640995200000ULL);
}

TEST_CASE("parse can require exact case", "[ulid][parse]") {
    ParseOptions strict;
    strict.case_insensitive = false;
    auto r = parse("01fr9ez700rpb9gr0nvwg3myfy", strict);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::InvalidCharacter);
    REQUIRE(parse("01FR9EZ700RPB9GR0NVWG3MYFY", strict).is_ok());
}

TEST_CASE("parse remaps I, L and O only when asked", "[ulid][parse]") {
    const std::string ambiguous = "O1FR9EZ7OORPB9GRONVWG3MYFY";
    REQUIRE(parse(ambiguous).error().code == UlidError::InvalidCharacter);

    ParseOptions remap;
    remap.remap_ambiguous = true;
    auto r = parse(ambiguous, remap);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().ulid == "01FR9EZ700RPB9GR0NVWG3MYFY");

    auto lower = parse("01fr9ez7oorpb9gr0nvwg3myfi", remap);
    REQUIRE(lower.is_ok());
    REQUIRE(lower.value().randomness_part == "RPB9GR0NVWG3MYF1");
}

TEST_CASE("parse does not range-check the time field", "[ulid][parse]") {
    auto r = parse("ZZZZZZZZZZ0000000000000000");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().timestamp == (1ULL << 50) - 1);
}

// ===== binary form =====

TEST_CASE("to_bytes known vector", "[ulid][bytes]") {
    auto r = to_bytes("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(r.is_ok());
    const UlidBytes expected = {0x01, 0x56, 0x3E, 0x3A, 0xB5, 0xD3, 0xD6, 0x76,
                                0x4C, 0x61, 0xEF, 0xB9, 0x93, 0x02, 0xBD, 0x5B};
    REQUIRE(r.value() == expected);
    REQUIRE(from_bytes(expected) == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST_CASE("binary extremes", "[ulid][bytes]") {
    UlidBytes zero{};
    REQUIRE(from_bytes(zero) == std::string(26, '0'));
    REQUIRE(to_bytes(std::string(26, '0')).value() == zero);

    UlidBytes ones;
    ones.fill(0xFF);
    REQUIRE(from_bytes(ones) == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(to_bytes("7ZZZZZZZZZZZZZZZZZZZZZZZZZ").value() == ones);
}

TEST_CASE("binary form keeps generated ULIDs intact", "[ulid][bytes]") {
    for (int i = 0; i < 20; ++i) {
        auto g = generate_standard().value();
        REQUIRE(from_bytes(to_bytes(g.ulid).value()) == g.ulid);
    }
}

TEST_CASE("to_bytes rejects values above 128 bits", "[ulid][bytes]") {
    auto r = to_bytes("80000000000000000000000000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::Range);
}

TEST_CASE("to_bytes applies parse rules", "[ulid][bytes]") {
    REQUIRE(to_bytes("short").error().code == UlidError::InvalidLength);
    REQUIRE(to_bytes("01ARZ3NDEKTSV4RRFFQ69G5FAU").error().code == UlidError::InvalidCharacter);
    REQUIRE(to_bytes("01arz3ndektsv4rrffq69g5fav").is_ok());
}
