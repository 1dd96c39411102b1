#pragma once

#include "fedtrust/federation/ttl_cache.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace fedtrust::federation {

struct BackoffState {
    std::uint32_t failure_count = 0;
    Clock::time_point next_retry_at{};
    Clock::duration base_delay{};
};

// Longest single backoff window, whatever the base delay and exponent
constexpr Clock::duration MAX_BACKOFF_DELAY = std::chrono::hours(24 * 365);

// Per-server exponential backoff: the n-th consecutive failure blocks
// retries for base_delay * 2^min(n, max_exponent), at most MAX_BACKOFF_DELAY.
// A success forgets the server entirely.
class BackoffTracker {
public:
    explicit BackoffTracker(
        Clock::duration base_delay = std::chrono::seconds(1),
        std::uint32_t max_exponent = 10,
        Clock::duration prune_after = std::chrono::hours(24)
    );
    
    bool can_retry(const std::string& server, Clock::time_point now = Clock::now()) const;
    std::optional<BackoffState> state(const std::string& server) const;
    
    BackoffState record_failure(const std::string& server, Clock::time_point now = Clock::now());
    void record_success(const std::string& server);
    
    // Drops servers whose retry time passed more than prune_after ago
    size_t prune(Clock::time_point now = Clock::now());
    
    Clock::duration delay_for(std::uint32_t failure_count) const;
    size_t size() const;

private:
    Clock::duration base_delay_;
    std::uint32_t max_exponent_;
    Clock::duration prune_after_;
    
    mutable std::shared_mutex mutex_;
    std::map<std::string, BackoffState> states_;
};

}
