#pragma once

#include <ulidkit/result.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace ulidkit {

struct GenerationResult {
    std::string ulid;
    uint64_t timestamp = 0;
    std::string randomness;
};

// Stateful generator guaranteeing strictly increasing identifiers for calls
// that share a timestamp.
//
// Fresh: nothing emitted since construction or reset(). Seeded: remembers the
// last time and random field. A call whose timestamp equals the remembered
// one emits last_random + 1; any other timestamp draws fresh randomness.
// Going backwards in time is allowed and simply reseeds.
//
// Every public member locks an internal mutex, so one instance may be shared
// across threads; all sharers then form one ordering domain.
class MonotonicSequencer {
public:
    // `default_seed` replaces the wall clock for calls that pass no time.
    explicit MonotonicSequencer(std::optional<int64_t> default_seed = std::nullopt);

    MonotonicSequencer(const MonotonicSequencer&) = delete;
    MonotonicSequencer& operator=(const MonotonicSequencer&) = delete;

    // Time is `seed_time`, else the default seed, else now_ms().
    // Err(TimeRange) leaves the state untouched.
    Result<GenerationResult> generate(std::optional<int64_t> seed_time = std::nullopt);

    // Makes `seed` the default seed, resetting first if it differs from the
    // current one, then generates. Both steps happen under one lock.
    // Err(TimeRange) leaves the state and the default seed untouched.
    Result<GenerationResult> generate_pinned(int64_t seed);

    // Back to Fresh and replace the default seed. Never fails; an invalid
    // seed surfaces as TimeRange on the next seedless generate().
    void reset(std::optional<int64_t> default_seed = std::nullopt);

    bool is_seeded() const;
    uint64_t last_time() const;
    std::string last_random() const;
    std::optional<int64_t> default_seed() const;

private:
    Result<GenerationResult> generate_locked(int64_t t);
    void reset_locked(std::optional<int64_t> default_seed);

    mutable std::mutex mu_;
    std::optional<int64_t> default_seed_;
    bool seeded_ = false;
    uint64_t last_time_ = 0;
    std::string last_random_;
};

} // namespace ulidkit
