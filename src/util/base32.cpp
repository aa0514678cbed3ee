#include <ulidkit/base32.hpp>
#include <ulidkit/log.hpp>
#include <ulidkit/random.hpp>
#include <cctype>

namespace ulidkit::base32 {

static const char kMaxSymbol = kAlphabet[kRadix - 1];

// ---- Symbol lookup ----

int symbol_index(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c < 'A' || c > 'Z') return -1;
    switch (c) {
        case 'I': case 'L': case 'O': case 'U': return -1;
        default: break;
    }
    // Letters after each excluded one shift down by one slot.
    int idx = 10 + (c - 'A');
    if (c > 'I') --idx;
    if (c > 'L') --idx;
    if (c > 'O') --idx;
    if (c > 'U') --idx;
    return idx;
}

bool is_valid_symbol(char c) {
    return symbol_index(c) >= 0;
}

static std::string describe_char(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return std::string("'") + c + "'";
    }
    return "byte " + std::to_string(static_cast<unsigned char>(c));
}

// ---- Integer encode/decode ----

Result<std::string> encode_int(uint64_t value, size_t width) {
    std::string out(width, kAlphabet[0]);
    uint64_t rest = value;
    for (size_t i = width; i > 0; --i) {
        out[i - 1] = kAlphabet[rest % kRadix];
        rest /= kRadix;
    }
    if (rest != 0) {
        return UlidError(UlidError::Range,
            "value " + std::to_string(value) + " does not fit in "
                + std::to_string(width) + " base32 symbols");
    }
    return Result<std::string>::ok(std::move(out));
}

Result<uint64_t> decode_int(const std::string& s) {
    if (s.size() > kMaxDecodeWidth) {
        return UlidError(UlidError::Range,
            "base32 field of " + std::to_string(s.size()) + " symbols overflows 64 bits",
            "decode at most " + std::to_string(kMaxDecodeWidth) + " symbols at a time");
    }
    uint64_t acc = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        int v = symbol_index(s[i]);
        if (v < 0) {
            return UlidError(UlidError::InvalidCharacter,
                "invalid base32 character " + describe_char(s[i])
                    + " at position " + std::to_string(i),
                "allowed symbols: 0-9 A-H J K M N P-T V-Z");
        }
        acc = acc * kRadix + static_cast<uint64_t>(v);
    }
    return Result<uint64_t>::ok(acc);
}

// ---- Counter increment ----

Result<std::string> increment_digits(const std::string& s) {
    std::string out = s;
    for (size_t i = out.size(); i > 0; --i) {
        int v = symbol_index(out[i - 1]);
        if (v < 0) {
            return UlidError(UlidError::InvalidCharacter,
                "cannot increment: invalid base32 character " + describe_char(out[i - 1])
                    + " at position " + std::to_string(i - 1));
        }
        if (out[i - 1] != kMaxSymbol) {
            out[i - 1] = kAlphabet[v + 1];
            return Result<std::string>::ok(std::move(out));
        }
        out[i - 1] = kAlphabet[0];
    }

    // Carried out of the leftmost digit.
    log::warn("base32 counter of width %zu overflowed; substituting fresh randomness",
              s.size());
    return Result<std::string>::ok(encode_random(s.size()));
}

// ---- Case handling ----

std::string normalize(const std::string& s, bool remap_ambiguous) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (remap_ambiguous) {
            if (u == 'I' || u == 'L') u = '1';
            else if (u == 'O') u = '0';
        }
        out += u;
    }
    return out;
}

} // namespace ulidkit::base32
