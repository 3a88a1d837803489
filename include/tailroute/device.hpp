// === Device Model ============================================================
//
// Normalized view of a mesh peer as reported by one status query, and the
// snapshot that groups every peer of a single poll.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tailroute/types.hpp"

namespace tailroute {

/**
 * @brief A service port a device advertises through its tags.
 */
struct AdvertisedPort final {
    std::string name{};                  /**< Service name taken from the tag (e.g. "web"). */
    std::uint16_t port{};                /**< TCP/UDP port number. */
    Protocol protocol{Protocol::Http};   /**< Section the port belongs to. */
    std::string scheme{"http"};          /**< Backend scheme: http, https, tcp or udp. */

    bool operator==(const AdvertisedPort&) const = default;
};

/**
 * @brief Captures the observable state of a mesh device at snapshot time.
 */
struct Device final {
    std::string id{};                            /**< Stable node identifier. */
    std::string host_name{};                     /**< Display/host name. */
    std::string dns_name{};                      /**< MagicDNS name without trailing dot. */
    std::string os{};                            /**< Operating system reported by the node. */
    std::vector<std::string> tags{};             /**< Tags with the "tag:" prefix stripped. */
    std::vector<std::string> addresses{};        /**< Mesh IP addresses, source order. */
    std::vector<AdvertisedPort> ports{};         /**< Ports derived from tags, sorted by port. */
    bool online{};                               /**< Reachability as reported by the daemon. */
    bool exit_node{};                            /**< Device is the active exit node. */
    bool expired{};                              /**< Node key has expired. */
    std::optional<SystemTimePoint> last_write{}; /**< Last write; empty when never written. */

    /** @brief True when @p tag is among the device tags. */
    [[nodiscard]] bool has_tag(const std::string& tag) const;

    /**
     * @brief First IPv4 address, otherwise the first address; empty when the
     *        device has none.
     */
    [[nodiscard]] std::string preferred_address() const;
};

/**
 * @brief All devices of one poll ordered by device id.
 */
struct Snapshot final {
    std::vector<Device> devices{};  /**< Sorted by Device::id. */
    std::string revision{};         /**< Digest of the source payload. */
    std::string backend_state{};    /**< Daemon backend state (e.g. "Running"). */
    std::string magic_dns_suffix{}; /**< Tailnet DNS suffix. */
};

}  // namespace tailroute
