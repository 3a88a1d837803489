// === Route Selector ==========================================================
//
// Applies the device filter and the ordered selection rules to a snapshot and
// produces the ordered route list the translator consumes. Selection is a
// pure function of (snapshot, rules, filter, now): routes are ordered by
// device id, then rule index.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tailroute/device.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/selection_rule.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

/** @brief Device-level exclusions applied before any rule. */
struct DeviceFilter final {
    bool exclude_exit_nodes{true};
    bool exclude_expired{true};
    std::vector<std::string> exclude_hostnames{};
    std::vector<std::string> include_os{};          /**< Empty allows every OS. */
    std::optional<std::chrono::seconds> max_inactive{};

    /**
     * @brief True when @p device may be routed at @p now.
     * @param reason Receives a short label when the device is rejected.
     */
    [[nodiscard]] bool admits(const Device& device, SystemTimePoint now, std::string* reason = nullptr) const;
};

/** @brief One rule applied to one device. */
struct Route final {
    std::size_t rule_index{};
    std::string rule_name{};
    std::string device_id{};
    std::string host_name{};        /**< Raw device host name. */
    std::string address{};          /**< Mesh address used as backend. */
    std::uint16_t port{};
    std::string scheme{"http"};
    std::string host{};             /**< Rendered host/SNI; empty when the rule has none. */
    RoutingHints hints{};

    bool operator==(const Route&) const = default;
};

/** @brief Stateless selector bound to one rule set and filter. */
class RouteSelector final {
  public:
    RouteSelector(RuleSet rule_set, DeviceFilter filter);

    /** @brief Rules currently in effect. */
    [[nodiscard]] const RuleSet& rule_set() const noexcept;

    [[nodiscard]] const DeviceFilter& filter() const noexcept;

    /** @brief Compute the ordered routes for @p snapshot. */
    [[nodiscard]] std::vector<Route> select(const Snapshot& snapshot, SystemTimePoint now) const;

  private:
    /** @brief Resolve the backend port for @p rule on @p device. */
    [[nodiscard]] std::optional<AdvertisedPort> resolve_port(const SelectionRule& rule, const Device& device) const;

    RuleSet rule_set_;
    DeviceFilter filter_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Lower-cased host name with characters outside [a-z0-9-] replaced by '-'. */
[[nodiscard]] std::string sanitize_host_name(const std::string& host_name);

/** @brief Expand a host template for one device and rule. */
[[nodiscard]] std::string render_host(const std::string& host_template, const Device& device, const std::string& rule_name);

}  // namespace tailroute
