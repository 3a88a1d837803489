#include <chrono>

#include <catch2/catch.hpp>

#include "tailroute/errors.hpp"
#include "tailroute/status_parser.hpp"

using namespace tailroute;

namespace {

constexpr char k_status_body[] = R"JSON({
  "Version": "1.70.0",
  "BackendState": "Running",
  "MagicDNSSuffix": "tailnet.ts.net",
  "Self": {
    "ID": "nSelf",
    "HostName": "gateway",
    "DNSName": "gateway.tailnet.ts.net.",
    "OS": "linux",
    "TailscaleIPs": ["100.64.0.10", "fd7a:115c:a1e0::10"],
    "Tags": ["tag:web-9000"]
  },
  "Peer": {
    "nodekey:bbb": {
      "ID": "nB",
      "HostName": "nas",
      "DNSName": "nas.tailnet.ts.net.",
      "OS": "linux",
      "TailscaleIPs": ["100.64.0.2"],
      "Online": false,
      "LastWrite": "0001-01-01T00:00:00Z"
    },
    "nodekey:aaa": {
      "ID": "nA",
      "HostName": "web-box",
      "DNSName": "web-box.tailnet.ts.net.",
      "OS": "linux",
      "TailscaleIPs": ["fd7a:115c:a1e0::1", "100.64.0.1"],
      "Tags": ["tag:expose=web", "tag:web-8080", "tag:admin-8443-https", "tag:database"],
      "Online": true,
      "ExitNode": true,
      "Expired": false,
      "LastWrite": "2024-05-01T12:30:00.123456789Z"
    },
    "nodekey:ccc": null
  }
})JSON";

}  // namespace

TEST_CASE("Status bodies become snapshots ordered by device id") {
    const Snapshot snapshot = parse_status(k_status_body, StatusParseOptions{});

    REQUIRE(snapshot.backend_state == "Running");
    REQUIRE(snapshot.magic_dns_suffix == "tailnet.ts.net");
    REQUIRE(snapshot.devices.size() == 2);
    REQUIRE(snapshot.devices[0].id == "nA");
    REQUIRE(snapshot.devices[1].id == "nB");

    const Device& web_box = snapshot.devices[0];
    REQUIRE(web_box.host_name == "web-box");
    REQUIRE(web_box.dns_name == "web-box.tailnet.ts.net");
    REQUIRE(web_box.tags == std::vector<std::string>{"expose=web", "web-8080", "admin-8443-https", "database"});
    REQUIRE(web_box.online);
    REQUIRE(web_box.exit_node);
    REQUIRE_FALSE(web_box.expired);
    REQUIRE(web_box.preferred_address() == "100.64.0.1");
    REQUIRE(web_box.last_write.has_value());

    REQUIRE(web_box.ports.size() == 2);
    REQUIRE(web_box.ports[0].port == 8080);
    REQUIRE(web_box.ports[0].scheme == "http");
    REQUIRE(web_box.ports[1].port == 8443);
    REQUIRE(web_box.ports[1].scheme == "https");

    const Device& nas = snapshot.devices[1];
    REQUIRE_FALSE(nas.online);
    REQUIRE_FALSE(nas.last_write.has_value());
    REQUIRE(nas.ports.empty());
}

TEST_CASE("The local node is included only on request") {
    StatusParseOptions options{};
    options.include_self = true;
    const Snapshot snapshot = parse_status(k_status_body, options);

    REQUIRE(snapshot.devices.size() == 3);
    const Device& self_device = snapshot.devices[2];
    REQUIRE(self_device.id == "nSelf");
    REQUIRE(self_device.online);
    REQUIRE(self_device.ports.size() == 1);
    REQUIRE(self_device.ports[0].port == 9000);
}

TEST_CASE("Configured tag mappings add ports to matching devices") {
    StatusParseOptions options{};
    options.tag_ports = parse_tag_port_mapping("database:5432:tcp,web-8080:8080");
    const Snapshot snapshot = parse_status(k_status_body, options);

    const Device& web_box = snapshot.devices[0];
    REQUIRE(web_box.ports.size() == 3);
    REQUIRE(web_box.ports[0].port == 5432);
    REQUIRE(web_box.ports[0].protocol == Protocol::Tcp);
    REQUIRE(web_box.ports[1].port == 8080);
    REQUIRE(web_box.ports[2].port == 8443);
}

TEST_CASE("A status without peers is an empty snapshot") {
    const Snapshot snapshot = parse_status(R"({"BackendState":"Running","Peer":{}})", StatusParseOptions{});
    REQUIRE(snapshot.devices.empty());
    REQUIRE(snapshot.backend_state == "Running");

    const Snapshot no_peer_key = parse_status(R"({"BackendState":"Stopped"})", StatusParseOptions{});
    REQUIRE(no_peer_key.devices.empty());
}

TEST_CASE("Unusable status bodies raise SourceUnavailable") {
    REQUIRE_THROWS_AS(parse_status("not json", StatusParseOptions{}), SourceUnavailable);
    REQUIRE_THROWS_AS(parse_status("[1,2,3]", StatusParseOptions{}), SourceUnavailable);
    REQUIRE_THROWS_AS(parse_status(R"({"Peer":{"k":{"HostName":"x"}}})", StatusParseOptions{}), SourceUnavailable);
    REQUIRE_THROWS_AS(parse_status(R"({"Peer":{"k":42}})", StatusParseOptions{}), SourceUnavailable);
}

TEST_CASE("Snapshot revision follows the payload bytes") {
    const Snapshot first = parse_status(k_status_body, StatusParseOptions{});
    const Snapshot second = parse_status(k_status_body, StatusParseOptions{});
    const Snapshot other = parse_status(R"({"Peer":{}})", StatusParseOptions{});

    REQUIRE(first.revision == second.revision);
    REQUIRE(first.revision != other.revision);
    REQUIRE(first.revision.size() == 16);
    // FNV-1a 64 of the empty string is the offset basis.
    REQUIRE(payload_digest("") == "cbf29ce484222325");
}

TEST_CASE("RFC 3339 timestamps honour offsets and reject the zero time") {
    using namespace std::chrono;
    const SystemTimePoint expected = sys_days{year{2024} / 1 / 2} + hours{3} + minutes{4} + seconds{5};

    REQUIRE(parse_rfc3339("2024-01-02T03:04:05Z") == expected);
    REQUIRE(parse_rfc3339("2024-01-02T03:04:05.999Z") == expected);
    REQUIRE(parse_rfc3339("2024-01-02T04:04:05+01:00") == expected);
    REQUIRE(parse_rfc3339("2024-01-02T01:34:05-01:30") == expected);

    REQUIRE_FALSE(parse_rfc3339("0001-01-01T00:00:00Z").has_value());
    REQUIRE_FALSE(parse_rfc3339("2024-02-30T00:00:00Z").has_value());
    REQUIRE_FALSE(parse_rfc3339("yesterday").has_value());
    REQUIRE_FALSE(parse_rfc3339("2024-01-02T03:04:05").has_value());
}

TEST_CASE("A default port makes bare tags advertise it") {
    StatusParseOptions options{};
    options.tag_defaults.port = 80;
    const Snapshot snapshot = parse_status(k_status_body, options);

    const Device& web_box = snapshot.devices[0];
    REQUIRE(web_box.ports.size() == 3);
    REQUIRE(web_box.ports[0].port == 80);
    REQUIRE(web_box.ports[0].name == "expose=web");
    REQUIRE(web_box.ports[0].scheme == "http");
    REQUIRE(web_box.ports[1].port == 8080);
    REQUIRE(web_box.ports[2].port == 8443);
}
