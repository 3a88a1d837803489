// === Dynamic Configuration Document ==========================================
//
// In-memory model of the Traefik dynamic configuration the provider emits.
// Every collection is an ordered map, so two equal documents always serialize
// to identical bytes and equality is plain member-wise comparison.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tailroute {

struct RouterTls final {
    std::string cert_resolver{};
    bool passthrough{false};  /**< TCP routers only. */

    bool operator==(const RouterTls&) const = default;
};

struct HttpRouter final {
    std::string rule{};
    std::string service{};
    std::vector<std::string> entry_points{};
    std::vector<std::string> middlewares{};
    std::optional<int> priority{};
    std::optional<RouterTls> tls{};

    bool operator==(const HttpRouter&) const = default;
};

struct HealthCheck final {
    std::string path{};
    std::string interval{};
    std::string timeout{};

    bool operator==(const HealthCheck&) const = default;
};

struct HttpService final {
    std::vector<std::string> server_urls{};  /**< `scheme://address:port`. */
    std::optional<HealthCheck> health_check{};

    bool operator==(const HttpService&) const = default;
};

/** @brief One of the middleware kinds the translator generates. */
struct Middleware final {
    std::vector<std::string> strip_prefixes{};
    std::map<std::string, std::string> custom_request_headers{};
    std::optional<int> retry_attempts{};

    bool operator==(const Middleware&) const = default;
};

struct TcpRouter final {
    std::string rule{};
    std::string service{};
    std::vector<std::string> entry_points{};
    std::optional<int> priority{};
    std::optional<RouterTls> tls{};

    bool operator==(const TcpRouter&) const = default;
};

struct UdpRouter final {
    std::string service{};
    std::vector<std::string> entry_points{};

    bool operator==(const UdpRouter&) const = default;
};

/** @brief TCP and UDP load balancers share the `address` server form. */
struct AddressService final {
    std::vector<std::string> server_addresses{};  /**< `address:port`. */

    bool operator==(const AddressService&) const = default;
};

struct HttpSection final {
    std::map<std::string, HttpRouter> routers{};
    std::map<std::string, HttpService> services{};
    std::map<std::string, Middleware> middlewares{};

    bool operator==(const HttpSection&) const = default;
};

struct TcpSection final {
    std::map<std::string, TcpRouter> routers{};
    std::map<std::string, AddressService> services{};

    bool operator==(const TcpSection&) const = default;
};

struct UdpSection final {
    std::map<std::string, UdpRouter> routers{};
    std::map<std::string, AddressService> services{};

    bool operator==(const UdpSection&) const = default;
};

/** @brief Complete Traefik dynamic configuration. */
struct ConfigurationDocument final {
    HttpSection http{};
    TcpSection tcp{};
    UdpSection udp{};

    /** @brief Router count across all sections. */
    [[nodiscard]] std::size_t router_count() const noexcept;

    bool operator==(const ConfigurationDocument&) const = default;
};

void to_json(nlohmann::json& json_out, const ConfigurationDocument& document);

/**
 * @brief Traefik JSON for @p document. The `http` section is always present;
 *        `tcp` and `udp` only when they hold routers or services.
 */
[[nodiscard]] std::string serialize(const ConfigurationDocument& document);

}  // namespace tailroute
