// === Provider Runtime ========================================================
//
// Wires configuration, state client, selector, publish engine, delivery
// channel and the optional HTTP endpoint together, and owns the Watch Loop
// thread.

#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "tailroute/config_server.hpp"
#include "tailroute/configuration.hpp"
#include "tailroute/delivery_channel.hpp"
#include "tailroute/publish_engine.hpp"
#include "tailroute/state_client.hpp"
#include "tailroute/status_board.hpp"
#include "tailroute/watch_loop.hpp"

namespace tailroute {

class ProviderRuntime final {
  public:
    explicit ProviderRuntime(Configuration configuration);
    ~ProviderRuntime();

    /**
     * @brief Load rules and build the pipeline.
     * @throws SelectionConfigError for an invalid rule file.
     */
    void initialize();
    /** @brief Start the HTTP endpoint (pull mode) and the Watch Loop thread. */
    void run();
    /** @brief Stop the Watch Loop, join it, and close the endpoint. */
    void shutdown();
    /** @brief Forward a SIGHUP to the Watch Loop. */
    void request_rule_reload();

  private:
    /** @brief Log the daemon backend state once; failures are not fatal. */
    void check_source();

    Configuration configuration_;
    StatusBoard status_board_;
    std::unique_ptr<LocalApiStateClient> state_client_;
    std::unique_ptr<DeliveryChannel> delivery_channel_;
    HttpDeliveryChannel* http_channel_{nullptr}; /**< Set in pull mode; owned by delivery_channel_. */
    std::unique_ptr<PublishEngine> publish_engine_;
    std::unique_ptr<ConfigServer> config_server_;
    std::unique_ptr<WatchLoop> watch_loop_;
    std::atomic<bool> flag_running_{false};
    std::thread watch_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
