#include <algorithm>
#include <chrono>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "pipeline_fakes.hpp"
#include "tailroute/config_translator.hpp"
#include "tailroute/route_selector.hpp"

using namespace tailroute;
using tailroute::test::make_device;
using tailroute::test::make_port;
using tailroute::test::make_snapshot;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tailroute::test::ensure_logger_initialized();
    return true;
}();

const SystemTimePoint k_now = SystemTimePoint{} + std::chrono::hours{24 * 365 * 50};

constexpr char k_rules[] = R"JSON({
  "rules": [
    {"name": "web", "match": "tag(\"web\")", "port": 8080, "host": "{host}.internal",
     "retry_attempts": 5, "priority": 7},
    {"name": "api", "match": "tag(\"api\")", "port": 9000, "host": "api.internal",
     "path_prefix": "/v1", "aggregate": true},
    {"name": "db", "match": "tag(\"db\")", "protocol": "tcp", "port_name": "db",
     "host": "{host}.db", "tls": {"passthrough": true}}
  ]
})JSON";

std::vector<Device> mesh_devices() {
    Device alpha = make_device("nA", "alpha", {"web", "api"}, {"100.64.0.1"});
    Device beta = make_device("nB", "beta", {"web", "api", "db"}, {"100.64.0.2"});
    beta.ports.push_back(make_port("db", 5432, Protocol::Tcp, "tcp"));
    Device gamma = make_device("nC", "gamma", {"db"}, {"100.64.0.3"});
    gamma.ports.push_back(make_port("db", 5433, Protocol::Tcp, "tcp"));
    return {gamma, alpha, beta};
}

std::string render(const RouteSelector& selector, const Snapshot& snapshot) {
    return serialize(translate(selector.select(snapshot, k_now), TranslatorOptions{}));
}

}  // namespace

TEST_CASE("Selecting and translating a snapshot is byte-for-byte repeatable") {
    const RouteSelector selector{parse_rule_set(k_rules), DeviceFilter{}};
    std::vector<Device> list_devices = mesh_devices();
    const Snapshot snapshot = make_snapshot(list_devices);

    const std::string first = render(selector, snapshot);
    REQUIRE(first == render(selector, snapshot));
    REQUIRE(first == render(RouteSelector{parse_rule_set(k_rules), DeviceFilter{}}, snapshot));

    std::reverse(list_devices.begin(), list_devices.end());
    REQUIRE(first == render(selector, make_snapshot(list_devices, "r2")));

    const nlohmann::json parsed = nlohmann::json::parse(first);
    REQUIRE(parsed["http"]["routers"].size() == 3);
    REQUIRE(parsed["tcp"]["routers"].size() == 2);
    REQUIRE(parsed["http"]["services"]["tailscale-api"]["loadBalancer"]["servers"].size() == 2);
}

TEST_CASE("Rule hints reach the published document intact") {
    const RouteSelector selector{parse_rule_set(k_rules), DeviceFilter{}};
    const nlohmann::json parsed = nlohmann::json::parse(render(selector, make_snapshot(mesh_devices())));

    const auto& web_router = parsed["http"]["routers"]["tailscale-web-alpha-nA-router"];
    REQUIRE(web_router["rule"] == "Host(`alpha.internal`)");
    REQUIRE(web_router["priority"] == 7);
    REQUIRE(parsed["http"]["middlewares"]["tailscale-web-alpha-nA-router-retry"]["retry"]["attempts"] == 5);

    const auto& db_router = parsed["tcp"]["routers"]["tailscale-db-gamma-nC-router"];
    REQUIRE(db_router["rule"] == "HostSNI(`gamma.db`)");
    REQUIRE(db_router["tls"]["passthrough"] == true);
    REQUIRE(parsed["tcp"]["services"]["tailscale-db-gamma-nC"]["loadBalancer"]["servers"][0]["address"] == "100.64.0.3:5433");
}
