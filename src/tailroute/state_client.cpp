#include "tailroute/state_client.hpp"

#include <optional>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "tailroute/errors.hpp"
#include "tailroute/version.hpp"

namespace tailroute {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {
constexpr char k_status_target[] = "/localapi/v0/status";
constexpr char k_status_without_peers_target[] = "/localapi/v0/status?peers=false";
constexpr char k_localapi_host[] = "local-tailscaled.sock";
constexpr std::string_view k_tcp_scheme{"tcp://"};
constexpr std::uint64_t k_max_body_bytes{64 * 1024 * 1024};

using UnixStream = beast::basic_stream<asio::local::stream_protocol>;

std::string basic_authorization(const std::string& token) {
    const std::string credentials = ":" + token;
    std::string encoded(beast::detail::base64::encoded_size(credentials.size()), '\0');
    const std::size_t length = beast::detail::base64::encode(encoded.data(), credentials.data(), credentials.size());
    encoded.resize(length);
    return "Basic " + encoded;
}

}  // namespace

LocalApiEndpoint LocalApiEndpoint::parse(std::string_view text) {
    LocalApiEndpoint endpoint{};
    if (text.empty()) {
        endpoint.socket_path = std::string{k_default_socket_path};
        return endpoint;
    }
    if (text.substr(0, k_tcp_scheme.size()) != k_tcp_scheme) {
        endpoint.socket_path = std::string{text};
        return endpoint;
    }

    // tcp://host:port[:token]
    std::string_view remainder = text.substr(k_tcp_scheme.size());
    const std::size_t host_end = remainder.find(':');
    if (host_end == std::string_view::npos || host_end == 0) {
        throw ConfigurationError(fmt::format("LocalAPI endpoint '{}' needs tcp://host:port", text));
    }
    endpoint.kind = Kind::Tcp;
    endpoint.host = std::string{remainder.substr(0, host_end)};
    remainder.remove_prefix(host_end + 1);

    const std::size_t port_end = remainder.find(':');
    endpoint.port = std::string{remainder.substr(0, port_end)};
    if (endpoint.port.empty()) {
        throw ConfigurationError(fmt::format("LocalAPI endpoint '{}' has an empty port", text));
    }
    if (port_end != std::string_view::npos) {
        const std::string_view token = remainder.substr(port_end + 1);
        if (!token.empty()) {
            endpoint.token = std::string{token};
        }
    }
    return endpoint;
}

std::string LocalApiEndpoint::describe() const {
    if (kind == Kind::UnixSocket) {
        return "unix:" + socket_path;
    }
    return fmt::format("tcp://{}:{}{}", host, port, token.has_value() ? " (token)" : "");
}

struct LocalApiStateClient::ContextRegistration final {
    ContextRegistration(LocalApiStateClient& owner, asio::io_context& io_context) : owner_(owner) {
        std::scoped_lock lock(owner_.mutex_);
        if (owner_.flag_cancelled_) {
            throw SourceUnavailable("State client has been cancelled");
        }
        owner_.active_context_ = &io_context;
    }

    ~ContextRegistration() {
        std::scoped_lock lock(owner_.mutex_);
        owner_.active_context_ = nullptr;
    }

    ContextRegistration(const ContextRegistration&) = delete;
    ContextRegistration& operator=(const ContextRegistration&) = delete;

    LocalApiStateClient& owner_;
};

LocalApiStateClient::LocalApiStateClient(LocalApiEndpoint endpoint, Duration timeout, StatusParseOptions parse_options)
    : endpoint_(std::move(endpoint)),
      timeout_(timeout),
      parse_options_(std::move(parse_options)),
      logger_(get_logger()) {
    logger_->info("LocalAPI state client targeting {} with {} ms timeout", endpoint_.describe(), timeout_.count());
}

Snapshot LocalApiStateClient::fetch_snapshot() {
    const std::string body = request(k_status_target);
    Snapshot snapshot = parse_status(body, parse_options_);
    logger_->debug(
        R"({{"component":"state_client","event":"snapshot","devices":{},"revision":{}}})",
        snapshot.devices.size(),
        json_string(snapshot.revision)
    );
    return snapshot;
}

void LocalApiStateClient::cancel() {
    std::scoped_lock lock(mutex_);
    flag_cancelled_ = true;
    if (active_context_ != nullptr) {
        active_context_->stop();
    }
}

std::string LocalApiStateClient::test_connection() {
    logger_->info("Testing connection to tailscaled at {}", endpoint_.describe());
    const Snapshot snapshot = parse_status(request(k_status_without_peers_target), parse_options_);
    logger_->info("Connected to tailscaled; backend state {}", snapshot.backend_state);
    return snapshot.backend_state;
}

template <typename Initiate>
boost::system::error_code LocalApiStateClient::run_step(asio::io_context& io_context, TimePoint deadline, Initiate&& initiate) {
    std::optional<boost::system::error_code> result;
    initiate([&result](boost::system::error_code error, auto&&...) { result = error; });
    {
        std::scoped_lock lock(mutex_);
        if (flag_cancelled_) {
            return asio::error::operation_aborted;
        }
        io_context.restart();
    }
    io_context.run_until(deadline);
    if (result.has_value()) {
        return *result;
    }
    std::scoped_lock lock(mutex_);
    return flag_cancelled_ ? asio::error::operation_aborted : asio::error::timed_out;
}

template <typename Stream>
std::string LocalApiStateClient::exchange(asio::io_context& io_context, Stream& stream, TimePoint deadline, const std::string& target) {
    http::request<http::empty_body> request{http::verb::get, target, 11};
    request.set(http::field::host, k_localapi_host);
    request.set(http::field::user_agent, fmt::format("{}/{}", k_service_name, k_version));
    if (endpoint_.token.has_value()) {
        request.set(http::field::authorization, basic_authorization(*endpoint_.token));
    }

    stream.expires_at(deadline);
    if (const auto error = run_step(io_context, deadline, [&](auto handler) {
            http::async_write(stream, request, std::move(handler));
        })) {
        throw SourceUnavailable(fmt::format("Failed to send LocalAPI request {}: {}", target, error.message()));
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(k_max_body_bytes);
    stream.expires_at(deadline);
    if (const auto error = run_step(io_context, deadline, [&](auto handler) {
            http::async_read(stream, buffer, parser, std::move(handler));
        })) {
        throw SourceUnavailable(fmt::format("Failed to read LocalAPI response {}: {}", target, error.message()));
    }

    http::response<http::string_body> response = parser.release();
    beast::error_code ignored_error;
    stream.socket().shutdown(asio::socket_base::shutdown_both, ignored_error);

    const unsigned int status_code = response.result_int();
    if (status_code < 200 || status_code >= 300) {
        const auto reason = response.reason();
        throw SourceUnavailable(
            fmt::format("LocalAPI {} answered HTTP {} {}", target, status_code, std::string(reason.data(), reason.size()))
        );
    }
    return std::move(response.body());
}

std::string LocalApiStateClient::request(const std::string& target) {
    asio::io_context io_context;
    const ContextRegistration registration{*this, io_context};
    const TimePoint deadline = SteadyClock::now() + timeout_;

    if (endpoint_.kind == LocalApiEndpoint::Kind::UnixSocket) {
        UnixStream stream{io_context};
        stream.expires_at(deadline);
        const asio::local::stream_protocol::endpoint socket_endpoint{endpoint_.socket_path};
        if (const auto error = run_step(io_context, deadline, [&](auto handler) {
                stream.async_connect(socket_endpoint, std::move(handler));
            })) {
            throw SourceUnavailable(fmt::format("Cannot connect to {}: {}", endpoint_.describe(), error.message()));
        }
        return exchange(io_context, stream, deadline, target);
    }

    asio::ip::tcp::resolver resolver{io_context};
    asio::ip::tcp::resolver::results_type results;
    if (const auto error = run_step(io_context, deadline, [&](auto handler) {
            resolver.async_resolve(
                endpoint_.host,
                endpoint_.port,
                [&results, handler = std::move(handler)](boost::system::error_code resolve_error,
                                                         asio::ip::tcp::resolver::results_type resolved) mutable {
                    results = std::move(resolved);
                    handler(resolve_error);
                }
            );
        })) {
        throw SourceUnavailable(fmt::format("Cannot resolve {}: {}", endpoint_.describe(), error.message()));
    }

    beast::tcp_stream stream{io_context};
    stream.expires_at(deadline);
    if (const auto error = run_step(io_context, deadline, [&](auto handler) {
            stream.async_connect(results, std::move(handler));
        })) {
        throw SourceUnavailable(fmt::format("Cannot connect to {}: {}", endpoint_.describe(), error.message()));
    }
    return exchange(io_context, stream, deadline, target);
}

}  // namespace tailroute
