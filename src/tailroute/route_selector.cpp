#include "tailroute/route_selector.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace tailroute {

namespace {

bool equals_ignore_case(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

bool contains_ignore_case(const std::vector<std::string>& list_values, const std::string& value) {
    return std::any_of(list_values.begin(), list_values.end(), [&value](const std::string& candidate) {
        return equals_ignore_case(candidate, value);
    });
}

void replace_all(std::string& text, std::string_view token, const std::string& replacement) {
    std::size_t position = 0;
    while ((position = text.find(token, position)) != std::string::npos) {
        text.replace(position, token.size(), replacement);
        position += replacement.size();
    }
}

}  // namespace

bool DeviceFilter::admits(const Device& device, SystemTimePoint now, std::string* reason) const {
    const auto reject = [reason](const char* label) {
        if (reason != nullptr) {
            *reason = label;
        }
        return false;
    };

    if (!device.online) {
        return reject("offline");
    }
    if (exclude_exit_nodes && device.exit_node) {
        return reject("exit_node");
    }
    if (exclude_expired && device.expired) {
        return reject("expired");
    }
    if (contains_ignore_case(exclude_hostnames, device.host_name)) {
        return reject("excluded_hostname");
    }
    if (!include_os.empty() && !contains_ignore_case(include_os, device.os)) {
        return reject("os_not_included");
    }
    if (max_inactive) {
        if (!device.last_write || now - *device.last_write > *max_inactive) {
            return reject("inactive");
        }
    }
    return true;
}

RouteSelector::RouteSelector(RuleSet rule_set, DeviceFilter filter)
    : rule_set_(std::move(rule_set)), filter_(std::move(filter)), logger_(get_logger()) {}

const RuleSet& RouteSelector::rule_set() const noexcept {
    return rule_set_;
}

const DeviceFilter& RouteSelector::filter() const noexcept {
    return filter_;
}

std::vector<Route> RouteSelector::select(const Snapshot& snapshot, SystemTimePoint now) const {
    std::vector<const Device*> list_devices;
    list_devices.reserve(snapshot.devices.size());
    for (const Device& device : snapshot.devices) {
        list_devices.push_back(&device);
    }
    std::stable_sort(list_devices.begin(), list_devices.end(), [](const Device* lhs, const Device* rhs) {
        return lhs->id < rhs->id;
    });

    std::vector<Route> list_routes;
    for (const Device* device : list_devices) {
        std::string str_reason;
        if (!filter_.admits(*device, now, &str_reason)) {
            logger_->debug(
                R"({{"component":"selector","event":"device_filtered","device":{},"reason":{}}})",
                json_string(device->id),
                json_string(str_reason)
            );
            continue;
        }

        for (std::size_t rule_index = 0; rule_index < rule_set_.rules.size(); ++rule_index) {
            const SelectionRule& rule = rule_set_.rules[rule_index];
            if (!rule.match.matches(*device)) {
                continue;
            }

            const std::string address = device->preferred_address();
            if (address.empty()) {
                logger_->warn(
                    R"({{"component":"selector","event":"device_without_address","device":{},"rule":{}}})",
                    json_string(device->id),
                    json_string(rule.name)
                );
                continue;
            }

            const auto port = resolve_port(rule, *device);
            if (!port) {
                logger_->debug(
                    R"({{"component":"selector","event":"no_usable_port","device":{},"rule":{}}})",
                    json_string(device->id),
                    json_string(rule.name)
                );
                continue;
            }

            Route route;
            route.rule_index = rule_index;
            route.rule_name = rule.name;
            route.device_id = device->id;
            route.host_name = device->host_name;
            route.address = address;
            route.port = port->port;
            route.hints = rule.hints;
            if (rule.hints.protocol == Protocol::Http) {
                if (rule.hints.tls && !rule.hints.tls->backend_scheme.empty()) {
                    route.scheme = rule.hints.tls->backend_scheme;
                } else {
                    route.scheme = port->scheme.empty() ? "http" : port->scheme;
                }
            } else {
                route.scheme = std::string{to_string(rule.hints.protocol)};
            }
            if (!rule.hints.host_template.empty()) {
                route.host = render_host(rule.hints.host_template, *device, rule.name);
            }
            list_routes.push_back(std::move(route));
        }
    }
    return list_routes;
}

std::optional<AdvertisedPort> RouteSelector::resolve_port(const SelectionRule& rule, const Device& device) const {
    const RoutingHints& hints = rule.hints;

    if (hints.port) {
        const auto iterator_advertised = std::find_if(device.ports.begin(), device.ports.end(), [&hints](const AdvertisedPort& port) {
            return port.port == *hints.port && port.protocol == hints.protocol;
        });
        if (iterator_advertised != device.ports.end()) {
            return *iterator_advertised;
        }
        if (hints.require_advertised) {
            return std::nullopt;
        }
        AdvertisedPort fixed;
        fixed.name = rule.name;
        fixed.port = *hints.port;
        fixed.protocol = hints.protocol;
        fixed.scheme = hints.protocol == Protocol::Http ? "http" : std::string{to_string(hints.protocol)};
        return fixed;
    }

    if (!hints.port_name.empty()) {
        const auto iterator_named = std::find_if(device.ports.begin(), device.ports.end(), [&hints](const AdvertisedPort& port) {
            return port.name == hints.port_name && port.protocol == hints.protocol;
        });
        if (iterator_named == device.ports.end()) {
            return std::nullopt;
        }
        return *iterator_named;
    }

    std::optional<AdvertisedPort> lowest;
    for (const AdvertisedPort& port : device.ports) {
        if (port.protocol == hints.protocol && (!lowest || port.port < lowest->port)) {
            lowest = port;
        }
    }
    return lowest;
}

std::string sanitize_host_name(const std::string& host_name) {
    std::string sanitized;
    sanitized.reserve(host_name.size());
    for (const char character : host_name) {
        const auto lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
        const bool allowed = (lowered >= 'a' && lowered <= 'z') || (lowered >= '0' && lowered <= '9') || lowered == '-';
        sanitized.push_back(allowed ? lowered : '-');
    }
    return sanitized;
}

std::string render_host(const std::string& host_template, const Device& device, const std::string& rule_name) {
    std::string rendered = host_template;
    replace_all(rendered, "{host}", sanitize_host_name(device.host_name));
    replace_all(rendered, "{dns}", device.dns_name);
    replace_all(rendered, "{id}", device.id);
    replace_all(rendered, "{rule}", rule_name);
    return rendered;
}

}  // namespace tailroute
