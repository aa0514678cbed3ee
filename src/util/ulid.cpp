#include <ulidkit/ulid.hpp>
#include <ulidkit/base32.hpp>
#include <ulidkit/random.hpp>
#include <ulidkit/timestamp.hpp>

namespace ulidkit {

// ---- Generation ----

Result<GenerationResult> generate_seeded(std::optional<int64_t> seed_time) {
    int64_t t = seed_time ? *seed_time : now_ms();
    ULIDKIT_TRY_ASSIGN(std::string time_part, encode_time(t));

    GenerationResult result;
    result.randomness = encode_random(kRandomLen);
    result.ulid = time_part + result.randomness;
    result.timestamp = static_cast<uint64_t>(t);
    return Result<GenerationResult>::ok(std::move(result));
}

Result<GenerationResult> generate_standard() {
    return generate_seeded(std::nullopt);
}

Result<GenerationResult> generate_monotonic(MonotonicSequencer& seq,
                                            std::optional<int64_t> seed_time) {
    if (seed_time) {
        return seq.generate_pinned(*seed_time);
    }
    return seq.generate();
}

MonotonicSequencer& default_sequencer() {
    static MonotonicSequencer seq;
    return seq;
}

Result<GenerationResult> generate_monotonic(std::optional<int64_t> seed_time) {
    return generate_monotonic(default_sequencer(), seed_time);
}

// ---- Parsing ----

std::string ParseResult::date_string() const {
    return format_iso8601(timestamp);
}

Result<ParseResult> parse(const std::string& s, const ParseOptions& options) {
    if (s.size() != kUlidLen) {
        return UlidError(UlidError::InvalidLength,
            "ULID must be " + std::to_string(kUlidLen) + " characters",
            "got " + std::to_string(s.size()) + " characters");
    }

    std::string canonical = s;
    if (options.case_insensitive || options.remap_ambiguous) {
        canonical = base32::normalize(s, options.remap_ambiguous);
    }
    for (size_t i = 0; i < canonical.size(); ++i) {
        if (!base32::is_valid_symbol(canonical[i])) {
            return UlidError(UlidError::InvalidCharacter,
                std::string("ULID contains invalid character '") + s[i] + "'",
                "at position " + std::to_string(i)
                    + "; allowed symbols: 0-9 A-H J K M N P-T V-Z");
        }
    }

    ParseResult out;
    out.timestamp_part = canonical.substr(0, kTimeLen);
    out.randomness_part = canonical.substr(kTimeLen);
    ULIDKIT_TRY_ASSIGN(out.timestamp, decode_time(out.timestamp_part));
    out.date = UlidTime(std::chrono::milliseconds(static_cast<int64_t>(out.timestamp)));
    out.ulid = std::move(canonical);
    return Result<ParseResult>::ok(std::move(out));
}

// ---- Binary form ----
// 26 symbols carry 130 bits; the top two must be zero. Bits are moved five
// at a time between the symbol string and the byte array, MSB first.

Result<UlidBytes> to_bytes(const std::string& s, const ParseOptions& options) {
    ULIDKIT_TRY_ASSIGN(ParseResult parsed, parse(s, options));
    const std::string& text = parsed.ulid;
    if (base32::symbol_index(text[0]) > 7) {
        return UlidError(UlidError::Range,
            "ULID " + text + " exceeds 128 bits",
            "the first character must be in 0-7");
    }

    UlidBytes bytes{};
    for (size_t i = 0; i < kUlidLen; ++i) {
        unsigned v = static_cast<unsigned>(base32::symbol_index(text[i]));
        for (int b = 4; b >= 0; --b) {
            // The two leading bits of the 130-bit string are zero here and dropped.
            int bit = static_cast<int>(i) * 5 + (4 - b) - 2;
            if (bit < 0) continue;
            if ((v >> b) & 1u) {
                bytes[bit / 8] |= static_cast<uint8_t>(0x80u >> (bit % 8));
            }
        }
    }
    return Result<UlidBytes>::ok(bytes);
}

std::string from_bytes(const UlidBytes& bytes) {
    std::string out(kUlidLen, base32::kAlphabet[0]);
    for (size_t i = 0; i < kUlidLen; ++i) {
        unsigned idx = 0;
        for (int j = 0; j < 5; ++j) {
            int bit = static_cast<int>(i) * 5 + j - 2;
            idx <<= 1;
            if (bit >= 0) {
                idx |= (bytes[bit / 8] >> (7 - bit % 8)) & 0x01u;
            }
        }
        out[i] = base32::kAlphabet[idx];
    }
    return out;
}

} // namespace ulidkit
