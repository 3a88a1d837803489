// === Status Board ============================================================
//
// Thread-safe holder of diagnostic pipeline state. The Watch Loop updates it
// after every cycle; the HTTP endpoint reads a copy for `GET /status`.

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "tailroute/types.hpp"

namespace tailroute {

/** @brief Snapshot of the pipeline for diagnostics. */
struct PipelineStatus final {
    std::string state{"idle"};
    std::string last_outcome{};
    std::string snapshot_revision{};
    std::size_t device_count{};
    std::size_t route_count{};
    std::uint64_t consecutive_failures{};
    Duration current_backoff{};
    std::uint64_t published_version{};
    std::uint64_t cycles{};
    std::string last_error{};
    std::optional<SystemTimePoint> last_success_at{};
};

class StatusBoard final {
  public:
    /** @brief Apply @p mutate to the status under the board lock. */
    void update(const std::function<void(PipelineStatus&)>& mutate);

    [[nodiscard]] PipelineStatus read() const;

  private:
    mutable std::mutex mutex_;
    PipelineStatus status_{};
};

/** @brief JSON body served by `GET /status`. */
[[nodiscard]] std::string status_json(const PipelineStatus& status);

}  // namespace tailroute
