// === Config Translator =======================================================
//
// Pure mapping from selected routes to the Traefik document. Router, service
// and middleware names are derived from (prefix, rule, host, id) only, so the
// same routes always produce the same document.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tailroute/dynamic_config.hpp"
#include "tailroute/route_selector.hpp"

namespace tailroute {

struct TranslatorOptions final {
    std::string name_prefix{"tailscale"};
};

/**
 * @brief Build and validate the document for @p routes.
 * @throws TranslationInvariantViolation when the result would contain a
 *         duplicate name or a dangling reference.
 */
[[nodiscard]] ConfigurationDocument translate(const std::vector<Route>& routes, const TranslatorOptions& options);

/**
 * @brief Check that every router references an existing service and every
 *        generated middleware reference resolves. External references
 *        (`name@provider`) are not checked.
 * @throws TranslationInvariantViolation on the first violation.
 */
void validate_document(const ConfigurationDocument& document);

/** @brief Replace characters outside [A-Za-z0-9-] with '-'. */
[[nodiscard]] std::string sanitize_name(const std::string& name);

/** @brief Service name of a per-device route. */
[[nodiscard]] std::string service_name_for(const Route& route, const TranslatorOptions& options);

/** @brief `address:port`, bracketing IPv6 addresses. */
[[nodiscard]] std::string backend_address(const std::string& address, std::uint16_t port);

}  // namespace tailroute
