// === Watch Loop ==============================================================
//
// Drives the pipeline: fetch a snapshot, select routes, translate, and hand
// the document to the publish engine. Source failures back off exponentially
// while the last published configuration keeps being served; translation and
// delivery failures keep it as well and are retried on the next cycle.
//
//   Idle -> Polling -> Processing -> Sleeping -> Polling ...
//   any state -> ShuttingDown (stop())

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "tailroute/backoff.hpp"
#include "tailroute/config_translator.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/publish_engine.hpp"
#include "tailroute/route_selector.hpp"
#include "tailroute/state_client.hpp"
#include "tailroute/status_board.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

enum class WatchState {
    Idle,
    Polling,
    Processing,
    Sleeping,
    ShuttingDown
};

/** @brief Result of one fetch/select/translate/publish pass. */
enum class CycleOutcome {
    Published,
    Suppressed,
    Deferred,
    SourceUnavailable,
    TranslationFailed,
    DeliveryFailed,
    Cancelled
};

[[nodiscard]] std::string_view to_string(WatchState state) noexcept;
[[nodiscard]] std::string_view to_string(CycleOutcome outcome) noexcept;

/** @brief Produces a fresh rule set on reload; throws SelectionConfigError. */
using RuleSetLoader = std::function<RuleSet()>;

struct WatchLoopSettings final {
    Duration poll_interval{std::chrono::seconds{30}};
    Duration backoff_max{std::chrono::seconds{300}};
    TranslatorOptions translator{};
    RuleSetLoader rule_loader{};  /**< Empty disables reloads. */
};

class WatchLoop final {
  public:
    WatchLoop(
        StateClient& state_client,
        RouteSelector selector,
        PublishEngine& publish_engine,
        StatusBoard& status_board,
        WatchLoopSettings settings
    );

    /** @brief Run a single cycle at @p now. */
    CycleOutcome run_cycle(TimePoint now);

    /** @brief Cycle until stop() is called. Blocks the calling thread. */
    void run();

    /** @brief Cancel an in-flight fetch and end run(). Safe from any thread. */
    void stop();

    /** @brief Re-read the rule file at the start of the next cycle. */
    void request_rule_reload();

    [[nodiscard]] WatchState state() const noexcept;

    /** @brief Delay before the next poll given the backoff state. */
    [[nodiscard]] Duration next_delay() const noexcept;

    [[nodiscard]] const RouteSelector& selector() const noexcept;

  private:
    void apply_pending_reload();
    void transition(WatchState next);
    void record_outcome(CycleOutcome outcome, const std::string& str_error);
    /** @brief Sleep until @p wake_at, flushing held documents as they fall due. */
    void sleep_until(TimePoint wake_at);

    StateClient& state_client_;
    RouteSelector selector_;
    PublishEngine& publish_engine_;
    StatusBoard& status_board_;
    WatchLoopSettings settings_;
    ExponentialBackoff backoff_;
    std::atomic<WatchState> state_{WatchState::Idle};
    std::atomic<bool> flag_stopping_{false};
    std::atomic<bool> flag_reload_requested_{false};
    std::mutex mutex_sleep_;
    std::condition_variable condition_wake_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
