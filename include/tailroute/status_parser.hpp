// === Status Parser ===========================================================
//
// Converts the JSON document returned by the tailscaled LocalAPI
// (`/localapi/v0/status`) into a normalized Snapshot. Parsing is pure so the
// State Client and the tests share the same code path.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tailroute/device.hpp"
#include "tailroute/service_tag.hpp"

namespace tailroute {

/** @brief Knobs controlling how a status document becomes a snapshot. */
struct StatusParseOptions final {
    bool include_self{false};          /**< Also emit the local node as a device. */
    TagDefaults tag_defaults{};        /**< Port and protocol for tags that leave them out. */
    TagPortMapping tag_ports{};        /**< Extra tag to port mappings. */
};

/**
 * @brief Parse a LocalAPI status body.
 * @throws SourceUnavailable when the body is not a usable status document.
 */
[[nodiscard]] Snapshot parse_status(std::string_view body, const StatusParseOptions& options);

/**
 * @brief Parse an RFC 3339 timestamp. Returns nullopt for the zero time
 *        (anything before the Unix epoch) and for unparseable input.
 */
[[nodiscard]] std::optional<SystemTimePoint> parse_rfc3339(std::string_view text);

/** @brief 64-bit FNV-1a digest of @p payload, hex encoded. */
[[nodiscard]] std::string payload_digest(std::string_view payload);

}  // namespace tailroute
