#include <chrono>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "pipeline_fakes.hpp"
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

RouteSelector selector_for(const std::string& rules_json, DeviceFilter filter = DeviceFilter{}) {
    return RouteSelector{parse_rule_set(rules_json), std::move(filter)};
}

}  // namespace

TEST_CASE("Only devices matching a rule become routes") {
    Device device_a = make_device("nA", "A", {"expose=web"});
    device_a.ports.push_back(make_port("web", 8080));
    const Device device_b = make_device("nB", "B", {}, {"100.64.0.2"});

    const RouteSelector selector = selector_for(
        R"JSON({"rules":[{"name":"web","match":"tag(\"expose=web\")","host":"a.internal","port":8080}]})JSON"
    );
    const std::vector<Route> routes = selector.select(make_snapshot({device_b, device_a}), k_now);

    REQUIRE(routes.size() == 1);
    const Route& route = routes.front();
    REQUIRE(route.device_id == "nA");
    REQUIRE(route.rule_name == "web");
    REQUIRE(route.address == "100.64.0.1");
    REQUIRE(route.port == 8080);
    REQUIRE(route.scheme == "http");
    REQUIRE(route.host == "a.internal");
}

TEST_CASE("Routes are ordered by device id then rule order") {
    const Device first = make_device("n1", "alpha", {"web", "api"}, {"100.64.0.1"});
    const Device second = make_device("n2", "beta", {"web"}, {"100.64.0.2"});

    const RouteSelector selector = selector_for(R"JSON({"rules":[
        {"name":"api","match":"tag(\"api\")","port":9000},
        {"name":"web","match":"tag(\"web\")","port":80}
    ]})JSON");
    const std::vector<Route> routes = selector.select(make_snapshot({second, first}), k_now);

    REQUIRE(routes.size() == 3);
    REQUIRE(routes[0].device_id == "n1");
    REQUIRE(routes[0].rule_name == "api");
    REQUIRE(routes[0].rule_index == 0);
    REQUIRE(routes[1].device_id == "n1");
    REQUIRE(routes[1].rule_name == "web");
    REQUIRE(routes[2].device_id == "n2");
    REQUIRE(routes[2].rule_index == 1);

    REQUIRE(selector.select(make_snapshot({first, second}), k_now) == routes);
}

TEST_CASE("Device filter rejects unusable devices") {
    DeviceFilter filter{};
    const Device healthy = make_device("n1", "box", {});
    std::string reason;

    REQUIRE(filter.admits(healthy, k_now, &reason));

    Device offline = healthy;
    offline.online = false;
    REQUIRE_FALSE(filter.admits(offline, k_now, &reason));
    REQUIRE(reason == "offline");

    Device exit_node = healthy;
    exit_node.exit_node = true;
    REQUIRE_FALSE(filter.admits(exit_node, k_now, &reason));
    REQUIRE(reason == "exit_node");

    Device expired = healthy;
    expired.expired = true;
    REQUIRE_FALSE(filter.admits(expired, k_now, &reason));
    REQUIRE(reason == "expired");

    filter.exclude_exit_nodes = false;
    filter.exclude_expired = false;
    REQUIRE(filter.admits(exit_node, k_now));
    REQUIRE(filter.admits(expired, k_now));

    filter.exclude_hostnames = {"BOX"};
    REQUIRE_FALSE(filter.admits(healthy, k_now, &reason));
    REQUIRE(reason == "excluded_hostname");
    filter.exclude_hostnames.clear();

    filter.include_os = {"windows", "macOS"};
    REQUIRE_FALSE(filter.admits(healthy, k_now, &reason));
    REQUIRE(reason == "os_not_included");
    filter.include_os = {"Linux"};
    REQUIRE(filter.admits(healthy, k_now));
}

TEST_CASE("Inactivity limit needs a recent last write") {
    DeviceFilter filter{};
    filter.max_inactive = std::chrono::seconds{600};
    Device device = make_device("n1", "box", {});
    std::string reason;

    REQUIRE_FALSE(filter.admits(device, k_now, &reason));
    REQUIRE(reason == "inactive");

    device.last_write = k_now - std::chrono::seconds{599};
    REQUIRE(filter.admits(device, k_now));

    device.last_write = k_now - std::chrono::seconds{601};
    REQUIRE_FALSE(filter.admits(device, k_now, &reason));
    REQUIRE(reason == "inactive");
}

TEST_CASE("Backend ports resolve from the rule and the advertised tags") {
    Device device = make_device("n1", "box", {"svc"});
    device.ports = {
        make_port("admin", 8443, Protocol::Http, "https"),
        make_port("web", 8080),
        make_port("db", 5432, Protocol::Tcp, "tcp"),
    };
    const Snapshot snapshot = make_snapshot({device});

    SECTION("lowest advertised port of the rule protocol") {
        const auto routes = selector_for(R"JSON({"rules":[{"name":"web","match":"tag(\"svc\")"}]})JSON").select(snapshot, k_now);
        REQUIRE(routes.size() == 1);
        REQUIRE(routes[0].port == 8080);
        REQUIRE(routes[0].scheme == "http");
    }

    SECTION("advertised scheme carries over for an explicit port") {
        const auto routes = selector_for(R"JSON({"rules":[{"name":"admin","match":"tag(\"svc\")","port":8443}]})JSON").select(snapshot, k_now);
        REQUIRE(routes.size() == 1);
        REQUIRE(routes[0].scheme == "https");
    }

    SECTION("fixed port without advertisement") {
        const auto routes = selector_for(R"JSON({"rules":[{"name":"metrics","match":"tag(\"svc\")","port":9100}]})JSON").select(snapshot, k_now);
        REQUIRE(routes.size() == 1);
        REQUIRE(routes[0].port == 9100);
        REQUIRE(routes[0].scheme == "http");
    }

    SECTION("require_advertised skips devices without the port") {
        const auto routes = selector_for(
            R"JSON({"rules":[{"name":"metrics","match":"tag(\"svc\")","port":9100,"require_advertised":true}]})JSON"
        ).select(snapshot, k_now);
        REQUIRE(routes.empty());
    }

    SECTION("named port of the same protocol") {
        const auto routes = selector_for(
            R"JSON({"rules":[{"name":"pg","match":"tag(\"svc\")","protocol":"tcp","port_name":"db"}]})JSON"
        ).select(snapshot, k_now);
        REQUIRE(routes.size() == 1);
        REQUIRE(routes[0].port == 5432);
        REQUIRE(routes[0].scheme == "tcp");

        const auto missing = selector_for(
            R"JSON({"rules":[{"name":"pg","match":"tag(\"svc\")","protocol":"tcp","port_name":"web"}]})JSON"
        ).select(snapshot, k_now);
        REQUIRE(missing.empty());
    }

    SECTION("backend scheme override") {
        const auto routes = selector_for(
            R"JSON({"rules":[{"name":"web","match":"tag(\"svc\")","port":8080,"tls":{"backend_scheme":"https"}}]})JSON"
        ).select(snapshot, k_now);
        REQUIRE(routes.size() == 1);
        REQUIRE(routes[0].scheme == "https");
    }

    SECTION("no port of the protocol skips the device") {
        const auto routes = selector_for(
            R"JSON({"rules":[{"name":"dns","match":"tag(\"svc\")","protocol":"udp"}]})JSON"
        ).select(snapshot, k_now);
        REQUIRE(routes.empty());
    }
}

TEST_CASE("Devices without an address are skipped") {
    Device device = make_device("n1", "box", {"web"}, {});
    const auto routes = selector_for(R"JSON({"rules":[{"name":"web","match":"tag(\"web\")","port":80}]})JSON")
                            .select(make_snapshot({device}), k_now);
    REQUIRE(routes.empty());
}

TEST_CASE("IPv4 addresses are preferred as backends") {
    const Device device = make_device("n1", "box", {"web"}, {"fd7a:115c:a1e0::1", "100.64.0.7"});
    const auto routes = selector_for(R"JSON({"rules":[{"name":"web","match":"tag(\"web\")","port":80}]})JSON")
                            .select(make_snapshot({device}), k_now);
    REQUIRE(routes.size() == 1);
    REQUIRE(routes[0].address == "100.64.0.7");
}

TEST_CASE("Host templates render device placeholders") {
    const Device device = make_device("nXYZ", "My_Laptop.local", {});

    REQUIRE(sanitize_host_name("My_Laptop.local") == "my-laptop-local");
    REQUIRE(render_host("{host}.example.com", device, "web") == "my-laptop-local.example.com");
    REQUIRE(render_host("{dns}", device, "web") == "My_Laptop.local.tailnet.ts.net");
    REQUIRE(render_host("{rule}-{id}.internal", device, "web") == "web-nXYZ.internal");
    REQUIRE(render_host("static.example.com", device, "web") == "static.example.com");
}
