// === Service Tags ============================================================
//
// Devices advertise ports through their tags. A tag following the
// `name-port[-protocol]` convention (e.g. `web-8443-https`, `db-5432-tcp`)
// advertises one port. A bare `name` tag advertises the configured default
// port, if there is one. Other tags can be mapped to ports with an
// operator-supplied `tag:port[:protocol]` list.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "tailroute/device.hpp"

namespace tailroute {

/** @brief What a tag advertises when it leaves out the port or the protocol. */
struct TagDefaults final {
    std::optional<std::uint16_t> port{}; /**< Port of a bare `name` tag; unset leaves bare tags silent. */
    Protocol protocol{Protocol::Http};   /**< Protocol of a `name-port` tag. */
    std::string scheme{"http"};          /**< Scheme of a `name-port` tag when the protocol is HTTP. */
};

/** @brief Tag name to advertised port, as configured by the operator. */
using TagPortMapping = std::map<std::string, AdvertisedPort>;

/** @brief Remove the `tag:` prefix the daemon reports on ACL tags. */
[[nodiscard]] std::string strip_tag_prefix(std::string_view tag);

/**
 * @brief Interpret @p tag with the `name-port[-protocol]` convention.
 *
 * The port is either the last segment or, when the last segment names a
 * protocol, the one before it. Unknown protocol names fall back to HTTP.
 * Ports without an explicit protocol take the protocol and scheme of
 * @p defaults; a tag without dashes takes its port as well.
 *
 * @return The advertised port, or nullopt when the tag does not follow the
 *         convention.
 */
[[nodiscard]] std::optional<AdvertisedPort> parse_service_tag(std::string_view tag, const TagDefaults& defaults);

/**
 * @brief Parse `tag:port[:protocol],tag2:port2` into a mapping.
 * @throws ConfigurationError on a malformed entry.
 */
[[nodiscard]] TagPortMapping parse_tag_port_mapping(std::string_view mapping);

/** @brief Scheme implied by a protocol name (`https` keeps its own scheme). */
[[nodiscard]] std::string scheme_for(std::string_view protocol_name, Protocol protocol);

}  // namespace tailroute
