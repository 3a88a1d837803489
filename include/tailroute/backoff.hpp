// === Backoff =================================================================
//
// Exponential delay after consecutive source failures: the base interval,
// doubled per failure and capped at the maximum. One success resets it.

#pragma once

#include <cstdint>

#include "tailroute/types.hpp"

namespace tailroute {

class ExponentialBackoff final {
  public:
    /** @param maximum Clamped up to @p base when smaller. */
    ExponentialBackoff(Duration base, Duration maximum);

    /** @brief Register a failure and return the delay before the next attempt. */
    Duration record_failure() noexcept;

    void reset() noexcept;

    /** @brief Delay to wait now: the base interval without failures. */
    [[nodiscard]] Duration current_delay() const noexcept;

    [[nodiscard]] std::uint32_t consecutive_failures() const noexcept;

  private:
    Duration base_;
    Duration maximum_;
    std::uint32_t consecutive_failures_{0};
};

}  // namespace tailroute
