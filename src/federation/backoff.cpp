#include "fedtrust/federation/backoff.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include <algorithm>

namespace fedtrust::federation {

BackoffTracker::BackoffTracker(Clock::duration base_delay, std::uint32_t max_exponent, Clock::duration prune_after)
    : base_delay_(base_delay)
    , max_exponent_(std::min<std::uint32_t>(max_exponent, 30))
    , prune_after_(prune_after) {
}

bool BackoffTracker::can_retry(const std::string& server, Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = states_.find(server);
    return it == states_.end() || now >= it->second.next_retry_at;
}

std::optional<BackoffState> BackoffTracker::state(const std::string& server) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = states_.find(server);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

BackoffState BackoffTracker::record_failure(const std::string& server, Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& state = states_[server];
    state.failure_count++;
    state.base_delay = base_delay_;
    
    auto delay = delay_for(state.failure_count);
    state.next_retry_at = now + delay;
    
    LOG_DEBUG("Backing off {} for {} after {} failures", server,
              core::utils::TimeUtils::format_duration(
                  std::chrono::duration_cast<std::chrono::milliseconds>(delay)),
              state.failure_count);
    return state;
}

void BackoffTracker::record_success(const std::string& server) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    states_.erase(server);
}

size_t BackoffTracker::prune(Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = states_.begin(); it != states_.end();) {
        if (it->second.next_retry_at + prune_after_ <= now) {
            it = states_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

Clock::duration BackoffTracker::delay_for(std::uint32_t failure_count) const {
    auto exponent = std::min(failure_count, max_exponent_);
    auto multiplier = std::int64_t{1} << exponent;
    if (base_delay_ > MAX_BACKOFF_DELAY / multiplier) {
        return MAX_BACKOFF_DELAY;
    }
    return base_delay_ * multiplier;
}

size_t BackoffTracker::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return states_.size();
}

}
