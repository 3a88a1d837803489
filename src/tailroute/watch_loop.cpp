#include "tailroute/watch_loop.hpp"

#include <algorithm>
#include <optional>

#include "tailroute/errors.hpp"

namespace tailroute {

std::string_view to_string(WatchState state) noexcept {
    switch (state) {
        case WatchState::Idle:
            return "idle";
        case WatchState::Polling:
            return "polling";
        case WatchState::Processing:
            return "processing";
        case WatchState::Sleeping:
            return "sleeping";
        case WatchState::ShuttingDown:
            return "shutting_down";
    }
    return "unknown";
}

std::string_view to_string(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::Published:
            return "published";
        case CycleOutcome::Suppressed:
            return "suppressed";
        case CycleOutcome::Deferred:
            return "deferred";
        case CycleOutcome::SourceUnavailable:
            return "source_unavailable";
        case CycleOutcome::TranslationFailed:
            return "translation_failed";
        case CycleOutcome::DeliveryFailed:
            return "delivery_failed";
        case CycleOutcome::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

WatchLoop::WatchLoop(
    StateClient& state_client,
    RouteSelector selector,
    PublishEngine& publish_engine,
    StatusBoard& status_board,
    WatchLoopSettings settings
)
    : state_client_(state_client),
      selector_(std::move(selector)),
      publish_engine_(publish_engine),
      status_board_(status_board),
      settings_(std::move(settings)),
      backoff_(settings_.poll_interval, settings_.backoff_max),
      logger_(get_logger()) {}

CycleOutcome WatchLoop::run_cycle(TimePoint now) {
    if (flag_stopping_.load()) {
        return CycleOutcome::Cancelled;
    }
    apply_pending_reload();

    transition(WatchState::Polling);
    Snapshot snapshot;
    try {
        snapshot = state_client_.fetch_snapshot();
    } catch (const SourceUnavailable& exc) {
        if (flag_stopping_.load()) {
            record_outcome(CycleOutcome::Cancelled, exc.what());
            return CycleOutcome::Cancelled;
        }
        const Duration delay = backoff_.record_failure();
        logger_->warn(
            R"({{"component":"watch_loop","event":"source_unavailable","failures":{},"retry_in_ms":{},"error":{}}})",
            backoff_.consecutive_failures(),
            delay.count(),
            json_string(exc.what())
        );
        record_outcome(CycleOutcome::SourceUnavailable, exc.what());
        return CycleOutcome::SourceUnavailable;
    }
    backoff_.reset();

    if (flag_stopping_.load()) {
        record_outcome(CycleOutcome::Cancelled, {});
        return CycleOutcome::Cancelled;
    }

    transition(WatchState::Processing);
    std::size_t route_count = 0;
    CycleOutcome outcome = CycleOutcome::Suppressed;
    try {
        const std::vector<Route> list_routes = selector_.select(snapshot, SystemClock::now());
        route_count = list_routes.size();
        const ConfigurationDocument document = translate(list_routes, settings_.translator);
        switch (publish_engine_.consider(document, now)) {
            case PublishDecision::Publish:
                outcome = CycleOutcome::Published;
                break;
            case PublishDecision::Suppress:
                outcome = CycleOutcome::Suppressed;
                break;
            case PublishDecision::Deferred:
                outcome = CycleOutcome::Deferred;
                break;
        }
    } catch (const TranslationInvariantViolation& exc) {
        logger_->error(R"({{"component":"watch_loop","event":"translation_failed","error":{}}})", json_string(exc.what()));
        outcome = CycleOutcome::TranslationFailed;
        record_outcome(outcome, exc.what());
        return outcome;
    } catch (const DeliveryError& exc) {
        logger_->error(R"({{"component":"watch_loop","event":"delivery_failed","error":{}}})", json_string(exc.what()));
        outcome = CycleOutcome::DeliveryFailed;
        record_outcome(outcome, exc.what());
        return outcome;
    }

    logger_->debug(
        R"({{"component":"watch_loop","event":"cycle","outcome":"{}","revision":{},"devices":{},"routes":{}}})",
        to_string(outcome),
        json_string(snapshot.revision),
        snapshot.devices.size(),
        route_count
    );
    status_board_.update([&snapshot, route_count](PipelineStatus& status) {
        status.snapshot_revision = snapshot.revision;
        status.device_count = snapshot.devices.size();
        status.route_count = route_count;
        status.last_success_at = SystemClock::now();
    });
    record_outcome(outcome, {});
    return outcome;
}

void WatchLoop::run() {
    logger_->info(
        R"({{"component":"watch_loop","event":"started","poll_interval_ms":{},"backoff_max_ms":{}}})",
        settings_.poll_interval.count(),
        settings_.backoff_max.count()
    );
    while (!flag_stopping_.load()) {
        try {
            run_cycle(SteadyClock::now());
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"watch_loop","event":"cycle_error","error":{}}})", json_string(exc.what()));
            record_outcome(CycleOutcome::TranslationFailed, exc.what());
        }
        if (flag_stopping_.load()) {
            break;
        }
        sleep_until(SteadyClock::now() + next_delay());
    }
    transition(WatchState::ShuttingDown);
    logger_->info(R"({"component":"watch_loop","event":"stopped"})");
}

void WatchLoop::stop() {
    if (flag_stopping_.exchange(true)) {
        return;
    }
    transition(WatchState::ShuttingDown);
    state_client_.cancel();
    {
        std::scoped_lock lock(mutex_sleep_);
    }
    condition_wake_.notify_all();
}

void WatchLoop::request_rule_reload() {
    flag_reload_requested_.store(true);
}

WatchState WatchLoop::state() const noexcept {
    return state_.load();
}

Duration WatchLoop::next_delay() const noexcept {
    return backoff_.current_delay();
}

const RouteSelector& WatchLoop::selector() const noexcept {
    return selector_;
}

void WatchLoop::apply_pending_reload() {
    if (!flag_reload_requested_.exchange(false)) {
        return;
    }
    if (!settings_.rule_loader) {
        logger_->warn(R"({"component":"watch_loop","event":"reload_ignored","reason":"no_loader"})");
        return;
    }
    if (selector_.rule_set().reload != ReloadPolicy::Sighup) {
        logger_->warn(R"({"component":"watch_loop","event":"reload_ignored","reason":"reload_policy_restart"})");
        return;
    }
    try {
        RuleSet rule_set = settings_.rule_loader();
        const std::size_t rule_count = rule_set.rules.size();
        selector_ = RouteSelector{std::move(rule_set), selector_.filter()};
        logger_->info(R"({{"component":"watch_loop","event":"rules_reloaded","rules":{}}})", rule_count);
    } catch (const SelectionConfigError& exc) {
        logger_->error(
            R"({{"component":"watch_loop","event":"reload_failed","error":{},"action":"keeping previous rules"}})",
            json_string(exc.what())
        );
    }
}

void WatchLoop::transition(WatchState next) {
    WatchState current = state_.load();
    // ShuttingDown is terminal.
    while (current != WatchState::ShuttingDown && !state_.compare_exchange_weak(current, next)) {
    }
    status_board_.update([this](PipelineStatus& status) { status.state = std::string{to_string(state_.load())}; });
}

void WatchLoop::record_outcome(CycleOutcome outcome, const std::string& str_error) {
    const PublishedConfigurationPtr published = publish_engine_.published();
    status_board_.update([&](PipelineStatus& status) {
        status.last_outcome = std::string{to_string(outcome)};
        status.consecutive_failures = backoff_.consecutive_failures();
        status.current_backoff = backoff_.current_delay();
        status.published_version = published ? published->version : 0;
        status.cycles += 1;
        if (!str_error.empty()) {
            status.last_error = str_error;
        }
    });
}

void WatchLoop::sleep_until(TimePoint wake_at) {
    transition(WatchState::Sleeping);
    bool flag_flush_failed = false;
    std::unique_lock lock(mutex_sleep_);
    while (!flag_stopping_.load()) {
        // After a failed flush the held document waits for the next cycle.
        std::optional<TimePoint> flush_at;
        if (!flag_flush_failed) {
            flush_at = publish_engine_.pending_deadline();
        }
        const TimePoint deadline = flush_at ? std::min(wake_at, *flush_at) : wake_at;
        condition_wake_.wait_until(lock, deadline, [this]() { return flag_stopping_.load(); });
        if (flag_stopping_.load()) {
            return;
        }

        const TimePoint now = SteadyClock::now();
        if (flush_at && now >= *flush_at) {
            lock.unlock();
            if (flag_stopping_.load()) {
                return;
            }
            try {
                if (publish_engine_.flush_due(now)) {
                    record_outcome(CycleOutcome::Published, {});
                }
            } catch (const DeliveryError& exc) {
                logger_->error(
                    R"({{"component":"watch_loop","event":"flush_failed","error":{}}})",
                    json_string(exc.what())
                );
                record_outcome(CycleOutcome::DeliveryFailed, exc.what());
                flag_flush_failed = true;
            }
            lock.lock();
        }
        if (now >= wake_at) {
            return;
        }
    }
}

}  // namespace tailroute
