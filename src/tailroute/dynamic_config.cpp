#include "tailroute/dynamic_config.hpp"

#include <nlohmann/json.hpp>

namespace tailroute {

namespace {
using nlohmann::json;

json router_tls_json(const RouterTls& tls) {
    json json_tls = json::object();
    if (!tls.cert_resolver.empty()) {
        json_tls["certResolver"] = tls.cert_resolver;
    }
    if (tls.passthrough) {
        json_tls["passthrough"] = true;
    }
    return json_tls;
}

json http_router_json(const HttpRouter& router) {
    json json_router{{"rule", router.rule}, {"service", router.service}};
    if (!router.entry_points.empty()) {
        json_router["entryPoints"] = router.entry_points;
    }
    if (!router.middlewares.empty()) {
        json_router["middlewares"] = router.middlewares;
    }
    if (router.priority) {
        json_router["priority"] = *router.priority;
    }
    if (router.tls) {
        json_router["tls"] = router_tls_json(*router.tls);
    }
    return json_router;
}

json http_service_json(const HttpService& service) {
    json list_servers = json::array();
    for (const auto& url : service.server_urls) {
        list_servers.push_back(json{{"url", url}});
    }
    json json_balancer{{"servers", std::move(list_servers)}};
    if (service.health_check) {
        json json_health{{"path", service.health_check->path}};
        if (!service.health_check->interval.empty()) {
            json_health["interval"] = service.health_check->interval;
        }
        if (!service.health_check->timeout.empty()) {
            json_health["timeout"] = service.health_check->timeout;
        }
        json_balancer["healthCheck"] = std::move(json_health);
    }
    return json{{"loadBalancer", std::move(json_balancer)}};
}

json middleware_json(const Middleware& middleware) {
    json json_middleware = json::object();
    if (!middleware.strip_prefixes.empty()) {
        json_middleware["stripPrefix"] = json{{"prefixes", middleware.strip_prefixes}};
    }
    if (!middleware.custom_request_headers.empty()) {
        json_middleware["headers"] = json{{"customRequestHeaders", middleware.custom_request_headers}};
    }
    if (middleware.retry_attempts) {
        json_middleware["retry"] = json{{"attempts", *middleware.retry_attempts}};
    }
    return json_middleware;
}

json address_service_json(const AddressService& service) {
    json list_servers = json::array();
    for (const auto& address : service.server_addresses) {
        list_servers.push_back(json{{"address", address}});
    }
    return json{{"loadBalancer", json{{"servers", std::move(list_servers)}}}};
}

template <typename Map, typename Convert>
json map_json(const Map& map_items, Convert convert) {
    json json_map = json::object();
    for (const auto& [name, item] : map_items) {
        json_map[name] = convert(item);
    }
    return json_map;
}

}  // namespace

std::size_t ConfigurationDocument::router_count() const noexcept {
    return http.routers.size() + tcp.routers.size() + udp.routers.size();
}

void to_json(json& json_out, const ConfigurationDocument& document) {
    json_out = json::object();

    json json_http{
        {"routers", map_json(document.http.routers, http_router_json)},
        {"services", map_json(document.http.services, http_service_json)},
    };
    if (!document.http.middlewares.empty()) {
        json_http["middlewares"] = map_json(document.http.middlewares, middleware_json);
    }
    json_out["http"] = std::move(json_http);

    if (!document.tcp.routers.empty() || !document.tcp.services.empty()) {
        json_out["tcp"] = json{
            {"routers", map_json(document.tcp.routers, [](const TcpRouter& router) {
                 json json_router{{"rule", router.rule}, {"service", router.service}};
                 if (!router.entry_points.empty()) {
                     json_router["entryPoints"] = router.entry_points;
                 }
                 if (router.priority) {
                     json_router["priority"] = *router.priority;
                 }
                 if (router.tls) {
                     json_router["tls"] = router_tls_json(*router.tls);
                 }
                 return json_router;
             })},
            {"services", map_json(document.tcp.services, address_service_json)},
        };
    }

    if (!document.udp.routers.empty() || !document.udp.services.empty()) {
        json_out["udp"] = json{
            {"routers", map_json(document.udp.routers, [](const UdpRouter& router) {
                 json json_router{{"service", router.service}};
                 if (!router.entry_points.empty()) {
                     json_router["entryPoints"] = router.entry_points;
                 }
                 return json_router;
             })},
            {"services", map_json(document.udp.services, address_service_json)},
        };
    }
}

std::string serialize(const ConfigurationDocument& document) {
    return json(document).dump(2);
}

}  // namespace tailroute
