#include <ulidkit/monotonic.hpp>
#include <ulidkit/base32.hpp>
#include <ulidkit/log.hpp>
#include <ulidkit/random.hpp>
#include <ulidkit/timestamp.hpp>

namespace ulidkit {

MonotonicSequencer::MonotonicSequencer(std::optional<int64_t> default_seed)
    : default_seed_(default_seed) {}

Result<GenerationResult> MonotonicSequencer::generate(std::optional<int64_t> seed_time) {
    std::lock_guard<std::mutex> lock(mu_);
    int64_t t = seed_time ? *seed_time : (default_seed_ ? *default_seed_ : now_ms());
    return generate_locked(t);
}

Result<GenerationResult> MonotonicSequencer::generate_pinned(int64_t seed) {
    std::lock_guard<std::mutex> lock(mu_);
    ULIDKIT_TRY(check_time(seed));
    if (default_seed_ != seed) {
        reset_locked(seed);
    }
    return generate_locked(seed);
}

Result<GenerationResult> MonotonicSequencer::generate_locked(int64_t t) {
    ULIDKIT_TRY_ASSIGN(std::string time_part, encode_time(t));

    std::string random_part;
    if (seeded_ && static_cast<uint64_t>(t) == last_time_) {
        ULIDKIT_TRY_ASSIGN(random_part, base32::increment_digits(last_random_));
    } else {
        random_part = encode_random(kRandomLen);
        if (seeded_) {
            log::debug("monotonic sequencer reseeded: %llu -> %lld",
                       static_cast<unsigned long long>(last_time_),
                       static_cast<long long>(t));
        }
        last_time_ = static_cast<uint64_t>(t);
    }
    last_random_ = random_part;
    seeded_ = true;

    GenerationResult result;
    result.ulid = time_part + random_part;
    result.timestamp = static_cast<uint64_t>(t);
    result.randomness = std::move(random_part);
    return Result<GenerationResult>::ok(std::move(result));
}

void MonotonicSequencer::reset(std::optional<int64_t> default_seed) {
    std::lock_guard<std::mutex> lock(mu_);
    reset_locked(default_seed);
}

void MonotonicSequencer::reset_locked(std::optional<int64_t> default_seed) {
    seeded_ = false;
    last_time_ = 0;
    last_random_.clear();
    default_seed_ = default_seed;
    if (default_seed) {
        log::debug("monotonic sequencer reset, default seed %lld",
                   static_cast<long long>(*default_seed));
    } else {
        log::debug("monotonic sequencer reset, default seed = wall clock");
    }
}

bool MonotonicSequencer::is_seeded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seeded_;
}

uint64_t MonotonicSequencer::last_time() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_time_;
}

std::string MonotonicSequencer::last_random() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_random_;
}

std::optional<int64_t> MonotonicSequencer::default_seed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return default_seed_;
}

} // namespace ulidkit
