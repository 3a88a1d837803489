#include "tailroute/provider_runtime.hpp"

#include <stdexcept>

#include "tailroute/errors.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/selection_rule.hpp"
#include "tailroute/version.hpp"

namespace tailroute {

ProviderRuntime::ProviderRuntime(Configuration configuration)
    : configuration_(std::move(configuration)), logger_(get_logger()) {}

ProviderRuntime::~ProviderRuntime() {
    shutdown();
}

void ProviderRuntime::initialize() {
    logger_->info("Initializing {} {}", k_service_name, k_version);

    RuleSet rule_set = load_rule_set(configuration_.rules_path);
    logger_->info(
        R"({{"component":"runtime","event":"rules_loaded","rules":{},"reload":"{}"}})",
        rule_set.rules.size(),
        rule_set.reload == ReloadPolicy::Sighup ? "sighup" : "restart"
    );

    state_client_ = std::make_unique<LocalApiStateClient>(
        configuration_.endpoint,
        configuration_.fetch_timeout,
        configuration_.status
    );

    if (configuration_.delivery_mode == DeliveryMode::Http) {
        auto http_channel = std::make_unique<HttpDeliveryChannel>();
        http_channel_ = http_channel.get();
        delivery_channel_ = std::move(http_channel);
        config_server_ = std::make_unique<ConfigServer>(
            configuration_.listen_address,
            configuration_.listen_port,
            *http_channel_,
            status_board_
        );
    } else {
        delivery_channel_ = std::make_unique<FileDeliveryChannel>(configuration_.output_path);
    }

    publish_engine_ = std::make_unique<PublishEngine>(configuration_.debounce_window, *delivery_channel_);

    WatchLoopSettings settings{};
    settings.poll_interval = configuration_.poll_interval;
    settings.backoff_max = configuration_.backoff_max;
    settings.translator = configuration_.translator;
    settings.rule_loader = [path_rules = configuration_.rules_path]() { return load_rule_set(path_rules); };

    watch_loop_ = std::make_unique<WatchLoop>(
        *state_client_,
        RouteSelector{std::move(rule_set), configuration_.filter},
        *publish_engine_,
        status_board_,
        std::move(settings)
    );

    check_source();
}

void ProviderRuntime::run() {
    if (!watch_loop_) {
        throw std::runtime_error("Provider runtime used before initialize()");
    }
    if (flag_running_.exchange(true)) {
        return;
    }
    if (config_server_) {
        config_server_->start();
    }
    logger_->info("Starting watch loop");
    watch_thread_ = std::thread([this]() { watch_loop_->run(); });
}

void ProviderRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down provider runtime");
    watch_loop_->stop();
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }
    if (config_server_) {
        config_server_->stop();
    }
}

void ProviderRuntime::request_rule_reload() {
    if (watch_loop_) {
        logger_->info(R"({"component":"runtime","event":"reload_requested"})");
        watch_loop_->request_rule_reload();
    }
}

void ProviderRuntime::check_source() {
    try {
        const std::string backend_state = state_client_->test_connection();
        logger_->info(
            R"({{"component":"runtime","event":"source_reachable","endpoint":{},"backend_state":{}}})",
            json_string(configuration_.endpoint.describe()),
            json_string(backend_state)
        );
    } catch (const SourceUnavailable& exc) {
        logger_->warn(
            R"({{"component":"runtime","event":"source_unreachable","endpoint":{},"error":{}}})",
            json_string(configuration_.endpoint.describe()),
            json_string(exc.what())
        );
    }
}

}  // namespace tailroute
