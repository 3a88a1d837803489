#include "tailroute/status_parser.hpp"

#include <algorithm>
#include <cstdio>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {
using nlohmann::json;

constexpr std::uint64_t k_fnv_offset_basis{0xcbf29ce484222325ULL};
constexpr std::uint64_t k_fnv_prime{0x100000001b3ULL};

std::string string_field(const json& object, const char* key) {
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || !iterator_field->is_string()) {
        return {};
    }
    return iterator_field->get<std::string>();
}

bool bool_field(const json& object, const char* key) {
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || !iterator_field->is_boolean()) {
        return false;
    }
    return iterator_field->get<bool>();
}

std::vector<std::string> string_list_field(const json& object, const char* key) {
    std::vector<std::string> list_values;
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || !iterator_field->is_array()) {
        return list_values;
    }
    for (const json& element : *iterator_field) {
        if (element.is_string()) {
            list_values.push_back(element.get<std::string>());
        }
    }
    return list_values;
}

std::vector<AdvertisedPort> derive_ports(const std::vector<std::string>& tags, const StatusParseOptions& options) {
    std::vector<AdvertisedPort> list_ports;
    const auto add_port = [&list_ports](const AdvertisedPort& candidate) {
        const bool duplicate = std::any_of(list_ports.begin(), list_ports.end(), [&candidate](const AdvertisedPort& existing) {
            return existing.port == candidate.port && existing.protocol == candidate.protocol;
        });
        if (!duplicate) {
            list_ports.push_back(candidate);
        }
    };

    for (const std::string& tag : tags) {
        if (const auto mapped = options.tag_ports.find(tag); mapped != options.tag_ports.end()) {
            add_port(mapped->second);
        }
        if (const auto advertised = parse_service_tag(tag, options.tag_defaults)) {
            add_port(*advertised);
        }
    }

    std::sort(list_ports.begin(), list_ports.end(), [](const AdvertisedPort& lhs, const AdvertisedPort& rhs) {
        if (lhs.port != rhs.port) {
            return lhs.port < rhs.port;
        }
        return lhs.protocol < rhs.protocol;
    });
    return list_ports;
}

Device parse_device(const json& peer, const StatusParseOptions& options) {
    Device device{};
    device.id = string_field(peer, "ID");
    if (device.id.empty()) {
        throw SourceUnavailable("Status peer entry is missing its ID");
    }
    device.host_name = string_field(peer, "HostName");
    device.dns_name = string_field(peer, "DNSName");
    if (!device.dns_name.empty() && device.dns_name.back() == '.') {
        device.dns_name.pop_back();
    }
    device.os = string_field(peer, "OS");
    for (const std::string& raw_tag : string_list_field(peer, "Tags")) {
        device.tags.push_back(strip_tag_prefix(raw_tag));
    }
    device.addresses = string_list_field(peer, "TailscaleIPs");
    device.online = bool_field(peer, "Online");
    device.exit_node = bool_field(peer, "ExitNode");
    device.expired = bool_field(peer, "Expired");
    device.last_write = parse_rfc3339(string_field(peer, "LastWrite"));
    device.ports = derive_ports(device.tags, options);
    return device;
}

}  // namespace

std::string payload_digest(std::string_view payload) {
    std::uint64_t hash = k_fnv_offset_basis;
    for (const char character : payload) {
        hash ^= static_cast<unsigned char>(character);
        hash *= k_fnv_prime;
    }
    return fmt::format("{:016x}", hash);
}

std::optional<SystemTimePoint> parse_rfc3339(std::string_view text) {
    if (text.size() < 19) {
        return std::nullopt;
    }
    const std::string buffer{text};
    int year = 0;
    unsigned int month = 0;
    unsigned int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int consumed = 0;
    if (std::sscanf(buffer.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (year < 1970) {
        return std::nullopt;
    }

    std::size_t position = static_cast<std::size_t>(consumed);
    if (position < buffer.size() && buffer[position] == '.') {
        ++position;
        while (position < buffer.size() && buffer[position] >= '0' && buffer[position] <= '9') {
            ++position;
        }
    }

    std::chrono::minutes offset{0};
    if (position < buffer.size() && (buffer[position] == '+' || buffer[position] == '-')) {
        int offset_hours = 0;
        int offset_minutes = 0;
        if (std::sscanf(buffer.c_str() + position + 1, "%2d:%2d", &offset_hours, &offset_minutes) != 2) {
            return std::nullopt;
        }
        offset = std::chrono::hours{offset_hours} + std::chrono::minutes{offset_minutes};
        if (buffer[position] == '-') {
            offset = -offset;
        }
    } else if (position >= buffer.size() || (buffer[position] != 'Z' && buffer[position] != 'z')) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!date.ok()) {
        return std::nullopt;
    }
    const auto local_time = std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute}
        + std::chrono::seconds{second};
    return std::chrono::time_point_cast<SystemClock::duration>(local_time - offset);
}

Snapshot parse_status(std::string_view body, const StatusParseOptions& options) {
    const json document = json::parse(body.begin(), body.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw SourceUnavailable("LocalAPI status body is not a JSON object");
    }

    Snapshot snapshot{};
    snapshot.revision = payload_digest(body);
    snapshot.backend_state = string_field(document, "BackendState");
    snapshot.magic_dns_suffix = string_field(document, "MagicDNSSuffix");

    const auto iterator_peers = document.find("Peer");
    if (iterator_peers != document.end() && iterator_peers->is_object()) {
        for (const auto& [peer_key, peer] : iterator_peers->items()) {
            if (peer.is_null()) {
                continue;
            }
            if (!peer.is_object()) {
                throw SourceUnavailable(fmt::format("Status peer {} is not an object", peer_key));
            }
            snapshot.devices.push_back(parse_device(peer, options));
        }
    }

    if (options.include_self) {
        const auto iterator_self = document.find("Self");
        if (iterator_self != document.end() && iterator_self->is_object()) {
            Device self_device = parse_device(*iterator_self, options);
            // The daemon omits Online for itself.
            self_device.online = true;
            snapshot.devices.push_back(std::move(self_device));
        }
    }

    std::sort(snapshot.devices.begin(), snapshot.devices.end(), [](const Device& lhs, const Device& rhs) {
        return lhs.id < rhs.id;
    });
    return snapshot;
}

}  // namespace tailroute
