#include "tailroute/backoff.hpp"

#include <algorithm>

namespace tailroute {

namespace {
constexpr std::uint32_t k_max_doublings{30};
}  // namespace

ExponentialBackoff::ExponentialBackoff(Duration base, Duration maximum)
    : base_(base), maximum_(std::max(base, maximum)) {}

Duration ExponentialBackoff::record_failure() noexcept {
    if (consecutive_failures_ < UINT32_MAX) {
        ++consecutive_failures_;
    }
    return current_delay();
}

void ExponentialBackoff::reset() noexcept {
    consecutive_failures_ = 0;
}

Duration ExponentialBackoff::current_delay() const noexcept {
    if (consecutive_failures_ == 0) {
        return base_;
    }
    const std::uint32_t doublings = std::min(consecutive_failures_ - 1, k_max_doublings);
    Duration delay = base_;
    for (std::uint32_t step = 0; step < doublings && delay < maximum_; ++step) {
        delay *= 2;
    }
    return std::min(delay, maximum_);
}

std::uint32_t ExponentialBackoff::consecutive_failures() const noexcept {
    return consecutive_failures_;
}

}  // namespace tailroute
