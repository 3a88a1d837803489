#include "tailroute/status_board.hpp"

#include <nlohmann/json.hpp>

#include "tailroute/version.hpp"

namespace tailroute {

void StatusBoard::update(const std::function<void(PipelineStatus&)>& mutate) {
    std::scoped_lock lock(mutex_);
    mutate(status_);
}

PipelineStatus StatusBoard::read() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

std::string status_json(const PipelineStatus& status) {
    nlohmann::json json_status{
        {"service", std::string{k_service_name}},
        {"version", std::string{k_version}},
        {"state", status.state},
        {"last_outcome", status.last_outcome},
        {"snapshot_revision", status.snapshot_revision},
        {"devices", status.device_count},
        {"routes", status.route_count},
        {"consecutive_failures", status.consecutive_failures},
        {"backoff_ms", status.current_backoff.count()},
        {"published_version", status.published_version},
        {"cycles", status.cycles},
    };
    json_status["last_error"] = status.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(status.last_error);
    if (status.last_success_at) {
        json_status["last_success_unix_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            status.last_success_at->time_since_epoch()
        ).count();
    } else {
        json_status["last_success_unix_ms"] = nullptr;
    }
    return json_status.dump();
}

}  // namespace tailroute
