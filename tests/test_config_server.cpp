#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "tailroute/config_server.hpp"
#include "tailroute/errors.hpp"

using namespace tailroute;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tailroute::test::ensure_logger_initialized();
    return true;
}();

PublishedConfigurationPtr make_published(std::uint64_t version) {
    auto published = std::make_shared<PublishedConfiguration>();
    published->version = version;
    published->etag = "\"" + std::to_string(version) + "\"";
    published->body = R"({"http":{"routers":{},"services":{}}})";
    return published;
}

HttpRequest make_request(http::verb method, const std::string& target) {
    HttpRequest request{method, target, 11};
    request.keep_alive(true);
    return request;
}

std::string header(const HttpResponse& response, http::field field) {
    const auto value = response[field];
    return std::string(value.data(), value.size());
}

}  // namespace

TEST_CASE("Config is served with validators") {
    const auto published = make_published(3);
    const HttpResponse response = handle_config_request(make_request(http::verb::get, "/config"), published, PipelineStatus{});

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(response.body() == published->body);
    REQUIRE(header(response, http::field::etag) == "\"3\"");
    REQUIRE(header(response, http::field::cache_control) == "no-cache");
    REQUIRE(header(response, http::field::content_type) == "application/json");
    REQUIRE(header(response, http::field::server) == "tailroute/0.3.0");
    REQUIRE(std::string(response["X-Config-Version"].data(), response["X-Config-Version"].size()) == "3");
    REQUIRE(response.keep_alive());
}

TEST_CASE("Matching validators answer 304") {
    const auto published = make_published(3);

    for (const char* validator : {"\"3\"", "W/\"3\"", "\"1\", \"3\"", "*"}) {
        INFO(validator);
        HttpRequest request = make_request(http::verb::get, "/config");
        request.set(http::field::if_none_match, validator);
        const HttpResponse response = handle_config_request(request, published, PipelineStatus{});
        REQUIRE(response.result() == http::status::not_modified);
        REQUIRE(response.body().empty());
        REQUIRE(header(response, http::field::etag) == "\"3\"");
    }

    HttpRequest stale = make_request(http::verb::get, "/config");
    stale.set(http::field::if_none_match, "\"2\"");
    REQUIRE(handle_config_request(stale, published, PipelineStatus{}).result() == http::status::ok);
}

TEST_CASE("Config before the first publish is unavailable") {
    const HttpResponse response = handle_config_request(make_request(http::verb::get, "/config"), nullptr, PipelineStatus{});
    REQUIRE(response.result() == http::status::service_unavailable);
    REQUIRE(header(response, http::field::retry_after) == "5");
    REQUIRE(nlohmann::json::parse(response.body())["error"] == "no configuration published yet");
}

TEST_CASE("Health, status, and unknown paths") {
    const HttpResponse health = handle_config_request(make_request(http::verb::get, "/"), nullptr, PipelineStatus{});
    REQUIRE(health.result() == http::status::ok);
    REQUIRE(nlohmann::json::parse(health.body()) == nlohmann::json{{"status", "OK"}, {"service", "tailroute"}});

    PipelineStatus status{};
    status.state = "sleeping";
    status.last_outcome = "published";
    status.device_count = 4;
    status.route_count = 2;
    status.published_version = 7;
    status.current_backoff = Duration{30000};
    const HttpResponse status_response = handle_config_request(make_request(http::verb::get, "/status?verbose=1"), nullptr, status);
    REQUIRE(status_response.result() == http::status::ok);
    const nlohmann::json status_body = nlohmann::json::parse(status_response.body());
    REQUIRE(status_body["state"] == "sleeping");
    REQUIRE(status_body["devices"] == 4);
    REQUIRE(status_body["routes"] == 2);
    REQUIRE(status_body["published_version"] == 7);
    REQUIRE(status_body["backoff_ms"] == 30000);
    REQUIRE(status_body["last_error"].is_null());
    REQUIRE(status_body["last_success_unix_ms"].is_null());

    REQUIRE(handle_config_request(make_request(http::verb::get, "/metrics"), nullptr, status).result() == http::status::not_found);
}

TEST_CASE("Only GET and HEAD are allowed") {
    const auto published = make_published(1);

    const HttpResponse rejected = handle_config_request(make_request(http::verb::post, "/config"), published, PipelineStatus{});
    REQUIRE(rejected.result() == http::status::method_not_allowed);
    REQUIRE(header(rejected, http::field::allow) == "GET, HEAD");

    const HttpResponse head = handle_config_request(make_request(http::verb::head, "/config"), published, PipelineStatus{});
    REQUIRE(head.result() == http::status::ok);
    REQUIRE(head.body().empty());
    REQUIRE(header(head, http::field::content_length) == std::to_string(published->body.size()));
}

TEST_CASE("The server answers over loopback") {
    HttpDeliveryChannel channel;
    StatusBoard board;
    ConfigServer server{"127.0.0.1", 0, channel, board};
    server.start();
    REQUIRE(server.port() != 0);

    channel.deliver(make_published(1));

    asio::io_context client_context;
    asio::ip::tcp::socket socket{client_context};
    socket.connect(asio::ip::tcp::endpoint{asio::ip::make_address("127.0.0.1"), server.port()});

    beast::flat_buffer buffer;
    for (const char* target : {"/config", "/status"}) {
        http::request<http::empty_body> request{http::verb::get, target, 11};
        request.set(http::field::host, "127.0.0.1");
        http::write(socket, request);

        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        REQUIRE(response.result() == http::status::ok);
        if (std::string{target} == "/config") {
            REQUIRE(response.body() == make_published(1)->body);
        } else {
            REQUIRE(nlohmann::json::parse(response.body())["service"] == "tailroute");
        }
    }

    beast::error_code ignored;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    server.stop();
}

TEST_CASE("Binding an invalid address is a delivery error") {
    HttpDeliveryChannel channel;
    StatusBoard board;
    ConfigServer server{"not-an-address", 0, channel, board};
    REQUIRE_THROWS_AS(server.start(), DeliveryError);
}
