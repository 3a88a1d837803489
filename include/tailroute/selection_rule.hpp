// === Selection Rules =========================================================
//
// Declarative rules deciding which devices become proxy routes, together
// with the routing hints the translator turns into routers and services.
// Rule sets are read from a JSON file once at startup (or on SIGHUP when the
// file opts into it); every validation problem is reported as a
// SelectionConfigError before the pipeline starts.

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tailroute/tag_predicate.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

/** @brief Router TLS settings. */
struct TlsPolicy final {
    std::string cert_resolver{}; /**< Traefik certificate resolver; empty uses the default store. */
    bool passthrough{false};     /**< TCP only: forward TLS without terminating it. */
    std::string backend_scheme{}; /**< HTTP only: overrides the backend scheme (e.g. "https"). */

    bool operator==(const TlsPolicy&) const = default;
};

/** @brief Active health check attached to HTTP load balancers. */
struct HealthCheckHints final {
    std::string path{};
    std::string interval{};
    std::string timeout{};

    bool operator==(const HealthCheckHints&) const = default;
};

/** @brief How a rule turns into routers, services, and middlewares. */
struct RoutingHints final {
    Protocol protocol{Protocol::Http};
    std::optional<std::uint16_t> port{};      /**< Fixed target port. */
    bool require_advertised{false};           /**< With `port`: device must advertise it. */
    std::string port_name{};                  /**< Pick the advertised port with this name. */
    std::string host_template{};              /**< Host/SNI template; empty means none. */
    std::string path_prefix{};                /**< HTTP PathPrefix matcher. */
    bool strip_prefix{false};                 /**< Strip path_prefix before forwarding. */
    std::optional<TlsPolicy> tls{};
    std::vector<std::string> entry_points{};
    std::vector<std::string> middlewares{};   /**< Externally defined middlewares. */
    std::map<std::string, std::string> request_headers{};
    std::optional<int> retry_attempts{};
    std::optional<int> priority{};
    std::optional<HealthCheckHints> health_check{};
    bool aggregate{false};                    /**< One load-balanced service for all matches. */

    bool operator==(const RoutingHints&) const = default;
};

/** @brief Named predicate plus routing hints. */
struct SelectionRule final {
    std::string name{};
    TagPredicate match{predicate::Always{}};
    RoutingHints hints{};
};

/** @brief When a changed rule file is picked up. */
enum class ReloadPolicy {
    Restart, /**< Rules are fixed for the process lifetime. */
    Sighup   /**< SIGHUP re-reads the rule file. */
};

/** @brief Ordered rules; the order is part of route ordering. */
struct RuleSet final {
    std::vector<SelectionRule> rules{};
    ReloadPolicy reload{ReloadPolicy::Restart};
};

/**
 * @brief Parse and validate a rule set document.
 * @throws SelectionConfigError describing the first problem found.
 */
[[nodiscard]] RuleSet parse_rule_set(std::string_view document);

/**
 * @brief Read and parse the rule set at @p path.
 * @throws SelectionConfigError when the file is missing or invalid.
 */
[[nodiscard]] RuleSet load_rule_set(const std::filesystem::path& path);

/** @brief Placeholders accepted in host templates. */
inline constexpr std::string_view k_host_placeholders[] = {"{host}", "{dns}", "{id}", "{rule}"};

}  // namespace tailroute
