#include "tailroute/service_tag.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

#include <fmt/format.h>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {
constexpr std::string_view k_tag_prefix{"tag:"};

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> list_parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t position = text.find(separator, start);
        if (position == std::string_view::npos) {
            list_parts.push_back(text.substr(start));
            break;
        }
        list_parts.push_back(text.substr(start, position - start));
        start = position + 1;
    }
    return list_parts;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned int value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc{} || end != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

std::string join(const std::vector<std::string_view>& parts, std::size_t count) {
    std::string joined;
    for (std::size_t index = 0; index < count; ++index) {
        if (index > 0) {
            joined.push_back('-');
        }
        joined.append(parts[index]);
    }
    return joined;
}

std::string lower(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

}  // namespace

std::string strip_tag_prefix(std::string_view tag) {
    if (tag.substr(0, k_tag_prefix.size()) == k_tag_prefix) {
        tag.remove_prefix(k_tag_prefix.size());
    }
    return std::string{tag};
}

std::string scheme_for(std::string_view protocol_name, Protocol protocol) {
    switch (protocol) {
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
        case Protocol::Http:
            break;
    }
    return lower(protocol_name) == "https" ? "https" : "http";
}

std::optional<AdvertisedPort> parse_service_tag(std::string_view tag, const TagDefaults& defaults) {
    const std::string clean_tag = strip_tag_prefix(tag);
    const std::vector<std::string_view> parts = split(clean_tag, '-');

    AdvertisedPort advertised{};
    if (parts.size() == 1) {
        if (!defaults.port || clean_tag.empty()) {
            return std::nullopt;
        }
        advertised.name = clean_tag;
        advertised.port = *defaults.port;
        advertised.protocol = defaults.protocol;
        advertised.scheme = scheme_for(defaults.scheme, defaults.protocol);
    } else if (const auto port = parse_port(parts.back())) {
        advertised.name = join(parts, parts.size() - 1);
        advertised.port = *port;
        advertised.protocol = defaults.protocol;
        advertised.scheme = scheme_for(defaults.scheme, defaults.protocol);
    } else if (parts.size() >= 3) {
        const auto protocol_port = parse_port(parts[parts.size() - 2]);
        if (!protocol_port) {
            return std::nullopt;
        }
        const std::string_view protocol_name = parts.back();
        advertised.name = join(parts, parts.size() - 2);
        advertised.port = *protocol_port;
        advertised.protocol = parse_protocol(protocol_name).value_or(Protocol::Http);
        advertised.scheme = scheme_for(protocol_name, advertised.protocol);
    } else {
        return std::nullopt;
    }

    if (advertised.name.empty()) {
        return std::nullopt;
    }
    return advertised;
}

TagPortMapping parse_tag_port_mapping(std::string_view mapping) {
    TagPortMapping map_ports;
    if (trim(mapping).empty()) {
        return map_ports;
    }
    for (const std::string_view raw_entry : split(mapping, ',')) {
        const std::string_view entry = trim(raw_entry);
        if (entry.empty()) {
            continue;
        }
        const std::vector<std::string_view> parts = split(entry, ':');
        if (parts.size() < 2 || parts.size() > 3) {
            throw ConfigurationError(fmt::format("Malformed tag port mapping entry '{}'", entry));
        }
        const std::string tag{trim(parts[0])};
        const auto port = parse_port(trim(parts[1]));
        if (tag.empty() || !port) {
            throw ConfigurationError(fmt::format("Malformed tag port mapping entry '{}'", entry));
        }
        const std::string_view protocol_name = parts.size() == 3 ? trim(parts[2]) : std::string_view{"http"};
        const auto protocol = parse_protocol(protocol_name);
        if (!protocol) {
            throw ConfigurationError(fmt::format("Unknown protocol '{}' in tag port mapping", protocol_name));
        }

        AdvertisedPort advertised{};
        advertised.name = tag;
        advertised.port = *port;
        advertised.protocol = *protocol;
        advertised.scheme = scheme_for(protocol_name, *protocol);
        map_ports[tag] = advertised;
    }
    return map_ports;
}

}  // namespace tailroute
