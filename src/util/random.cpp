#include <ulidkit/random.hpp>
#include <ulidkit/base32.hpp>
#include <ulidkit/log.hpp>
#include <atomic>
#include <fstream>
#include <random>
#include <vector>

namespace ulidkit {

static std::atomic<bool> s_degraded{false};

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_fallback(uint8_t* buf, size_t len) {
    if (!s_degraded.exchange(true)) {
        log::warn("/dev/urandom unavailable; using std::random_device + mt19937_64 "
                  "(identifiers are not cryptographically unpredictable)");
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    fill_fallback(buf, len);
}

bool random_source_degraded() {
    return s_degraded.load();
}

std::string encode_random(size_t width) {
    std::vector<uint8_t> bytes(width);
    fill_random_bytes(bytes.data(), bytes.size());

    // 256 is a multiple of 32, so the low five bits of a uniform byte are uniform.
    std::string out(width, base32::kAlphabet[0]);
    for (size_t i = 0; i < width; ++i) {
        out[i] = base32::kAlphabet[bytes[i] % base32::kRadix];
    }
    return out;
}

} // namespace ulidkit
