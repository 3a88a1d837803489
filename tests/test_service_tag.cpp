#include <catch2/catch.hpp>

#include "tailroute/errors.hpp"
#include "tailroute/service_tag.hpp"

using namespace tailroute;

namespace {
const TagDefaults k_http{};
}  // namespace

TEST_CASE("Service tags advertise ports with the default scheme") {
    const auto advertised = parse_service_tag("web-8080", k_http);
    REQUIRE(advertised.has_value());
    REQUIRE(advertised->name == "web");
    REQUIRE(advertised->port == 8080);
    REQUIRE(advertised->protocol == Protocol::Http);
    REQUIRE(advertised->scheme == "http");

    const auto secure_default = parse_service_tag("api-443", TagDefaults{std::nullopt, Protocol::Http, "https"});
    REQUIRE(secure_default.has_value());
    REQUIRE(secure_default->scheme == "https");
}

TEST_CASE("Service tags carry an explicit protocol suffix") {
    const auto https_port = parse_service_tag("tag:web-8443-https", k_http);
    REQUIRE(https_port.has_value());
    REQUIRE(https_port->port == 8443);
    REQUIRE(https_port->protocol == Protocol::Http);
    REQUIRE(https_port->scheme == "https");

    const auto tcp_port = parse_service_tag("db-5432-tcp", k_http);
    REQUIRE(tcp_port.has_value());
    REQUIRE(tcp_port->protocol == Protocol::Tcp);
    REQUIRE(tcp_port->scheme == "tcp");

    const auto udp_port = parse_service_tag("dns-53-udp", k_http);
    REQUIRE(udp_port.has_value());
    REQUIRE(udp_port->protocol == Protocol::Udp);

    const auto multi_segment = parse_service_tag("my-app-3000-http", k_http);
    REQUIRE(multi_segment.has_value());
    REQUIRE(multi_segment->name == "my-app");
    REQUIRE(multi_segment->port == 3000);

    const auto unknown_protocol = parse_service_tag("grpc-9000-h2c", k_http);
    REQUIRE(unknown_protocol.has_value());
    REQUIRE(unknown_protocol->protocol == Protocol::Http);
    REQUIRE(unknown_protocol->scheme == "http");
}

TEST_CASE("Tags outside the convention advertise nothing") {
    REQUIRE_FALSE(parse_service_tag("expose=web", k_http).has_value());
    REQUIRE_FALSE(parse_service_tag("web", k_http).has_value());
    REQUIRE_FALSE(parse_service_tag("web-http", k_http).has_value());
    REQUIRE_FALSE(parse_service_tag("web-99999", k_http).has_value());
    REQUIRE_FALSE(parse_service_tag("web-0", k_http).has_value());
    REQUIRE_FALSE(parse_service_tag("-8080", k_http).has_value());
}

TEST_CASE("Default port and protocol complete short tags") {
    const TagDefaults defaults{std::uint16_t{80}, Protocol::Tcp, "http"};

    const auto bare = parse_service_tag("tag:web", defaults);
    REQUIRE(bare.has_value());
    REQUIRE(bare->name == "web");
    REQUIRE(bare->port == 80);
    REQUIRE(bare->protocol == Protocol::Tcp);
    REQUIRE(bare->scheme == "tcp");

    const auto two_part = parse_service_tag("db-5432", defaults);
    REQUIRE(two_part.has_value());
    REQUIRE(two_part->port == 5432);
    REQUIRE(two_part->protocol == Protocol::Tcp);
    REQUIRE(two_part->scheme == "tcp");

    const auto explicit_protocol = parse_service_tag("web-8080-http", defaults);
    REQUIRE(explicit_protocol->protocol == Protocol::Http);

    const auto udp_default = parse_service_tag("dns-53", TagDefaults{std::nullopt, Protocol::Udp, "http"});
    REQUIRE(udp_default->protocol == Protocol::Udp);
    REQUIRE(udp_default->scheme == "udp");

    REQUIRE_FALSE(parse_service_tag("web-http", defaults).has_value());
    REQUIRE_FALSE(parse_service_tag("tag:", defaults).has_value());
}

TEST_CASE("strip_tag_prefix removes only the ACL prefix") {
    REQUIRE(strip_tag_prefix("tag:server") == "server");
    REQUIRE(strip_tag_prefix("server") == "server");
    REQUIRE(strip_tag_prefix("mytag:server") == "mytag:server");
}

TEST_CASE("Tag port mappings parse entries with optional protocol") {
    const TagPortMapping mapping = parse_tag_port_mapping(" database:5432:tcp , web:80 ,secure:8443:https");
    REQUIRE(mapping.size() == 3);
    REQUIRE(mapping.at("database").port == 5432);
    REQUIRE(mapping.at("database").protocol == Protocol::Tcp);
    REQUIRE(mapping.at("web").protocol == Protocol::Http);
    REQUIRE(mapping.at("web").scheme == "http");
    REQUIRE(mapping.at("secure").scheme == "https");

    REQUIRE(parse_tag_port_mapping("").empty());
    REQUIRE(parse_tag_port_mapping("  ").empty());
}

TEST_CASE("Malformed tag port mappings are configuration errors") {
    REQUIRE_THROWS_AS(parse_tag_port_mapping("database"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_tag_port_mapping("database:abc"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_tag_port_mapping("database:5432:ftp"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_tag_port_mapping(":5432"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_tag_port_mapping("a:1:tcp:extra"), ConfigurationError);
}
