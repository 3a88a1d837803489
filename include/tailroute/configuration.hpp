// === Configuration ===========================================================
//
// Strongly-typed settings for the provider. `ConfigurationLoader` reads them
// from `TAILROUTE_*` environment variables so downstream modules never touch
// `std::getenv` directly.

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "tailroute/config_translator.hpp"
#include "tailroute/route_selector.hpp"
#include "tailroute/state_client.hpp"
#include "tailroute/status_parser.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

/**
 * @brief Immutable bundle of runtime knobs. Every field is populated by
 *        ConfigurationLoader.
 */
struct Configuration final {
    std::string log_directory{};              /**< Destination directory for structured logs. */
    std::string log_level{"info"};
    LocalApiEndpoint endpoint{};              /**< Where tailscaled answers status queries. */
    Duration fetch_timeout{};                 /**< Bound on one status query. */
    Duration poll_interval{};
    Duration backoff_max{};
    Duration debounce_window{};
    DeliveryMode delivery_mode{DeliveryMode::Http};
    std::string listen_address{};             /**< Pull-mode bind address. */
    std::uint16_t listen_port{};
    std::filesystem::path output_path{};      /**< File-mode target. */
    std::filesystem::path rules_path{};
    TranslatorOptions translator{};
    StatusParseOptions status{};
    DeviceFilter filter{};
};

/** @brief Returns the value of a variable, or nullptr when unset. */
using EnvironmentLookup = std::function<const char*(const char*)>;

class ConfigurationLoader final {
  public:
    /**
     * @brief Read the process environment and initialize logging.
     * @throws ConfigurationError for settings that cannot be defaulted.
     */
    static Configuration load();

    /** @brief As load(), reading variables through @p lookup. */
    static Configuration load(const EnvironmentLookup& lookup);
};

}  // namespace tailroute
