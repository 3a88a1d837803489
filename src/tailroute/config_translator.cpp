#include "tailroute/config_translator.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {
constexpr char k_router_suffix[] = "-router";
constexpr std::string_view k_tcp_catch_all{"HostSNI(`*`)"};

template <typename Map, typename Value>
void insert_unique(Map& map_items, const std::string& name, Value value, std::string_view kind) {
    if (!map_items.emplace(name, std::move(value)).second) {
        throw TranslationInvariantViolation(fmt::format("Duplicate {} name '{}'", kind, name));
    }
}

void push_unique(std::vector<std::string>& list_values, std::string value) {
    if (std::find(list_values.begin(), list_values.end(), value) == list_values.end()) {
        list_values.push_back(std::move(value));
    }
}

std::string http_rule(const Route& route) {
    std::vector<std::string> list_matchers;
    if (!route.host.empty()) {
        list_matchers.push_back(fmt::format("Host(`{}`)", route.host));
    }
    if (!route.hints.path_prefix.empty()) {
        list_matchers.push_back(fmt::format("PathPrefix(`{}`)", route.hints.path_prefix));
    }
    if (list_matchers.empty()) {
        return "PathPrefix(`/`)";
    }
    return fmt::format("{}", fmt::join(list_matchers, " && "));
}

/** @brief Section under construction; aggregate services are extended in place. */
class DocumentBuilder final {
  public:
    explicit DocumentBuilder(const TranslatorOptions& options) : options_(options) {}

    void add(const Route& route) {
        const std::string service_name = route.hints.aggregate
            ? sanitize_name(fmt::format("{}-{}", options_.name_prefix, route.rule_name))
            : service_name_for(route, options_);
        const std::string router_name = service_name + k_router_suffix;

        switch (route.hints.protocol) {
            case Protocol::Http:
                add_http(route, router_name, service_name);
                break;
            case Protocol::Tcp:
                add_tcp(route, router_name, service_name);
                break;
            case Protocol::Udp:
                add_udp(route, router_name, service_name);
                break;
        }
    }

    [[nodiscard]] ConfigurationDocument take() {
        return std::move(document_);
    }

  private:
    /** @brief Extend an existing aggregate service; false when it is new. */
    template <typename Services, typename Append>
    bool extend_aggregate(const Route& route, Services& services, const std::string& service_name, Append append) {
        if (!route.hints.aggregate) {
            return false;
        }
        const auto iterator = services.find(service_name);
        if (iterator == services.end()) {
            return false;
        }
        append(iterator->second);
        return true;
    }

    void add_http(const Route& route, const std::string& router_name, const std::string& service_name) {
        const std::string url = fmt::format("{}://{}", route.scheme, backend_address(route.address, route.port));
        auto& section = document_.http;
        if (extend_aggregate(route, section.services, service_name, [&url](HttpService& service) {
                push_unique(service.server_urls, url);
            })) {
            return;
        }

        const RoutingHints& hints = route.hints;
        HttpRouter router;
        router.rule = http_rule(route);
        router.service = service_name;
        router.entry_points = hints.entry_points;
        router.priority = hints.priority;
        if (hints.tls) {
            router.tls = RouterTls{hints.tls->cert_resolver, false};
        }

        if (hints.strip_prefix) {
            Middleware strip;
            strip.strip_prefixes.push_back(hints.path_prefix);
            const std::string name = router_name + "-strip";
            insert_unique(section.middlewares, name, std::move(strip), "middleware");
            router.middlewares.push_back(name);
        }
        if (!hints.request_headers.empty()) {
            Middleware headers;
            headers.custom_request_headers = hints.request_headers;
            const std::string name = router_name + "-headers";
            insert_unique(section.middlewares, name, std::move(headers), "middleware");
            router.middlewares.push_back(name);
        }
        if (hints.retry_attempts) {
            Middleware retry;
            retry.retry_attempts = hints.retry_attempts;
            const std::string name = router_name + "-retry";
            insert_unique(section.middlewares, name, std::move(retry), "middleware");
            router.middlewares.push_back(name);
        }
        router.middlewares.insert(router.middlewares.end(), hints.middlewares.begin(), hints.middlewares.end());

        HttpService service;
        service.server_urls.push_back(url);
        if (hints.health_check) {
            service.health_check = HealthCheck{hints.health_check->path, hints.health_check->interval, hints.health_check->timeout};
        }

        insert_unique(section.routers, router_name, std::move(router), "router");
        insert_unique(section.services, service_name, std::move(service), "service");
    }

    void add_tcp(const Route& route, const std::string& router_name, const std::string& service_name) {
        const std::string address = backend_address(route.address, route.port);
        auto& section = document_.tcp;
        if (extend_aggregate(route, section.services, service_name, [&address](AddressService& service) {
                push_unique(service.server_addresses, address);
            })) {
            return;
        }

        const RoutingHints& hints = route.hints;
        TcpRouter router;
        router.rule = route.host.empty() ? std::string{k_tcp_catch_all} : fmt::format("HostSNI(`{}`)", route.host);
        router.service = service_name;
        router.entry_points = hints.entry_points;
        router.priority = hints.priority;
        if (hints.tls) {
            router.tls = RouterTls{hints.tls->cert_resolver, hints.tls->passthrough};
        }

        insert_unique(section.routers, router_name, std::move(router), "router");
        insert_unique(section.services, service_name, AddressService{{address}}, "service");
    }

    void add_udp(const Route& route, const std::string& router_name, const std::string& service_name) {
        const std::string address = backend_address(route.address, route.port);
        auto& section = document_.udp;
        if (extend_aggregate(route, section.services, service_name, [&address](AddressService& service) {
                push_unique(service.server_addresses, address);
            })) {
            return;
        }

        insert_unique(section.routers, router_name, UdpRouter{service_name, route.hints.entry_points}, "router");
        insert_unique(section.services, service_name, AddressService{{address}}, "service");
    }

    const TranslatorOptions& options_;
    ConfigurationDocument document_;
};

template <typename Routers, typename Services>
void check_service_references(const Routers& routers, const Services& services, std::string_view section) {
    for (const auto& [router_name, router] : routers) {
        if (router.service.empty() || services.count(router.service) == 0) {
            throw TranslationInvariantViolation(
                fmt::format("{} router '{}' references missing service '{}'", section, router_name, router.service)
            );
        }
    }
}

void check_priority(const std::optional<int>& priority, const std::string& router_name, std::string_view section) {
    if (priority && *priority < 0) {
        throw TranslationInvariantViolation(
            fmt::format("{} router '{}' has negative priority {}", section, router_name, *priority)
        );
    }
}

}  // namespace

std::string sanitize_name(const std::string& name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (const char character : name) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(character)) != 0 || character == '-';
        sanitized.push_back(allowed ? character : '-');
    }
    return sanitized;
}

std::string service_name_for(const Route& route, const TranslatorOptions& options) {
    return sanitize_name(
        fmt::format("{}-{}-{}-{}", options.name_prefix, route.rule_name, sanitize_host_name(route.host_name), route.device_id)
    );
}

std::string backend_address(const std::string& address, std::uint16_t port) {
    if (address.find(':') != std::string::npos) {
        return fmt::format("[{}]:{}", address, port);
    }
    return fmt::format("{}:{}", address, port);
}

ConfigurationDocument translate(const std::vector<Route>& routes, const TranslatorOptions& options) {
    DocumentBuilder builder{options};
    for (const Route& route : routes) {
        builder.add(route);
    }
    ConfigurationDocument document = builder.take();
    validate_document(document);
    return document;
}

void validate_document(const ConfigurationDocument& document) {
    check_service_references(document.http.routers, document.http.services, "http");
    check_service_references(document.tcp.routers, document.tcp.services, "tcp");
    check_service_references(document.udp.routers, document.udp.services, "udp");

    for (const auto& [router_name, router] : document.http.routers) {
        for (const auto& middleware : router.middlewares) {
            if (middleware.find('@') != std::string::npos) {
                continue;
            }
            if (document.http.middlewares.count(middleware) == 0) {
                throw TranslationInvariantViolation(
                    fmt::format("http router '{}' references missing middleware '{}'", router_name, middleware)
                );
            }
        }
        check_priority(router.priority, router_name, "http");
    }
    for (const auto& [middleware_name, middleware] : document.http.middlewares) {
        if (middleware.retry_attempts && *middleware.retry_attempts < 1) {
            throw TranslationInvariantViolation(
                fmt::format("middleware '{}' has non-positive retry attempts {}", middleware_name, *middleware.retry_attempts)
            );
        }
    }
    for (const auto& [router_name, router] : document.tcp.routers) {
        if (router.rule != k_tcp_catch_all && !router.tls) {
            throw TranslationInvariantViolation(
                fmt::format("tcp router '{}' matches {} without tls", router_name, router.rule)
            );
        }
        check_priority(router.priority, router_name, "tcp");
    }
}

}  // namespace tailroute
