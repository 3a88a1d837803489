// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the
// provider (clock primitives, proxy protocols, delivery modes).

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tailroute {

/**
 * @brief Alias for the monotonic clock driving poll cadence and debounce.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in milliseconds.
 */
using Duration = std::chrono::milliseconds;

/**
 * @brief Wall clock used for device activity and publish timestamps.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Timestamp captured from the wall clock.
 */
using SystemTimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Traefik configuration section a route is emitted into.
 */
enum class Protocol {
    Http,  /**< HTTP router and load balancer with URL servers. */
    Tcp,   /**< TCP router matched on SNI with address servers. */
    Udp    /**< UDP router forwarding to address servers. */
};

/**
 * @brief Selects how a published configuration reaches the proxy.
 */
enum class DeliveryMode {
    Http,  /**< Proxy polls GET /config. */
    File   /**< Proxy watches a file written atomically. */
};

/** @brief Lower-case protocol name used in logs and rule files. */
[[nodiscard]] std::string_view to_string(Protocol protocol) noexcept;

/**
 * @brief Parse a protocol name. `https` maps to Http; returns nullopt for
 *        names outside http/https/tcp/udp.
 */
[[nodiscard]] std::optional<Protocol> parse_protocol(std::string_view name);

}  // namespace tailroute
