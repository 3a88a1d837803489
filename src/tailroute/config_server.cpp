#include "tailroute/config_server.hpp"

#include <chrono>
#include <optional>
#include <string_view>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "tailroute/errors.hpp"
#include "tailroute/version.hpp"

namespace tailroute {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {
constexpr auto k_session_timeout = std::chrono::seconds(30);
constexpr std::uint32_t k_request_body_limit{64 * 1024};
constexpr char k_json_content_type[] = "application/json";

HttpResponse make_response(const HttpRequest& request, http::status status, std::string body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, fmt::format("{}/{}", k_service_name, k_version));
    response.set(http::field::content_type, k_json_content_type);
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

HttpResponse error_response(const HttpRequest& request, http::status status, const std::string& message) {
    return make_response(request, status, nlohmann::json{{"error", message}}.dump());
}

/** @brief True when an If-None-Match list names @p etag (or is `*`). */
bool etag_matches(beast::string_view if_none_match, const std::string& etag) {
    std::string_view remaining{if_none_match.data(), if_none_match.size()};
    while (!remaining.empty()) {
        const std::size_t comma = remaining.find(',');
        std::string_view candidate = remaining.substr(0, comma);
        while (!candidate.empty() && candidate.front() == ' ') {
            candidate.remove_prefix(1);
        }
        while (!candidate.empty() && candidate.back() == ' ') {
            candidate.remove_suffix(1);
        }
        if (candidate.substr(0, 2) == "W/") {
            candidate.remove_prefix(2);
        }
        if (candidate == "*" || candidate == etag) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(comma + 1);
    }
    return false;
}

}  // namespace

HttpResponse handle_config_request(const HttpRequest& request, const PublishedConfigurationPtr& published, const PipelineStatus& status) {
    beast::string_view target = request.target();
    const std::size_t query_start = target.find('?');
    if (query_start != beast::string_view::npos) {
        target = target.substr(0, query_start);
    }

    const bool known_path = target == "/" || target == "/config" || target == "/status";
    if (!known_path) {
        return error_response(request, http::status::not_found, "not found");
    }
    if (request.method() != http::verb::get && request.method() != http::verb::head) {
        HttpResponse response = error_response(request, http::status::method_not_allowed, "method not allowed");
        response.set(http::field::allow, "GET, HEAD");
        return response;
    }

    HttpResponse response;
    if (target == "/") {
        response = make_response(
            request,
            http::status::ok,
            nlohmann::json{{"status", "OK"}, {"service", std::string{k_service_name}}}.dump()
        );
    } else if (target == "/status") {
        response = make_response(request, http::status::ok, status_json(status));
    } else if (!published) {
        response = error_response(request, http::status::service_unavailable, "no configuration published yet");
        response.set(http::field::retry_after, "5");
    } else if (etag_matches(request[http::field::if_none_match], published->etag)) {
        response = make_response(request, http::status::not_modified, {});
        response.set(http::field::etag, published->etag);
        response.set("X-Config-Version", std::to_string(published->version));
    } else {
        response = make_response(request, http::status::ok, published->body);
        response.set(http::field::etag, published->etag);
        response.set(http::field::cache_control, "no-cache");
        response.set("X-Config-Version", std::to_string(published->version));
    }

    if (request.method() == http::verb::head) {
        const auto length = response.body().size();
        response.body().clear();
        if (response.result() != http::status::not_modified) {
            response.content_length(length);
        }
    }
    return response;
}

/** @brief One keep-alive connection; owns itself through shared_from_this. */
class ConfigServer::Session final : public std::enable_shared_from_this<ConfigServer::Session> {
  public:
    Session(tcp::socket socket, const HttpDeliveryChannel& channel, const StatusBoard& status_board, std::shared_ptr<spdlog::logger> logger)
        : stream_(std::move(socket)), channel_(channel), status_board_(status_board), logger_(std::move(logger)) {}

    void run() {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()]() { self->do_read(); });
    }

  private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(k_request_body_limit);
        stream_.expires_after(k_session_timeout);
        http::async_read(stream_, buffer_, *parser_, [self = shared_from_this()](beast::error_code error, std::size_t) {
            self->on_read(error);
        });
    }

    void on_read(beast::error_code error) {
        if (error == http::error::end_of_stream) {
            close();
            return;
        }
        if (error) {
            if (error != beast::error::timeout && error != asio::error::operation_aborted) {
                logger_->debug(R"({{"component":"config_server","event":"read_failed","error":{}}})", json_string(error.message()));
            }
            return;
        }

        const HttpRequest request = parser_->release();
        response_ = handle_config_request(request, channel_.current(), status_board_.read());
        logger_->debug(
            R"({{"component":"config_server","event":"request","method":{},"target":{},"status":{}}})",
            json_string(std::string_view(request.method_string().data(), request.method_string().size())),
            json_string(std::string_view(request.target().data(), request.target().size())),
            response_.result_int()
        );
        http::async_write(stream_, response_, [self = shared_from_this()](beast::error_code write_error, std::size_t) {
            self->on_write(write_error);
        });
    }

    void on_write(beast::error_code error) {
        if (error) {
            logger_->debug(R"({{"component":"config_server","event":"write_failed","error":{}}})", json_string(error.message()));
            return;
        }
        if (!response_.keep_alive()) {
            close();
            return;
        }
        do_read();
    }

    void close() {
        beast::error_code error;
        stream_.socket().shutdown(tcp::socket::shutdown_send, error);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    HttpResponse response_;
    const HttpDeliveryChannel& channel_;
    const StatusBoard& status_board_;
    std::shared_ptr<spdlog::logger> logger_;
};

ConfigServer::ConfigServer(std::string listen_address, std::uint16_t listen_port, const HttpDeliveryChannel& channel, const StatusBoard& status_board)
    : str_listen_address_(std::move(listen_address)),
      listen_port_(listen_port),
      channel_(channel),
      status_board_(status_board),
      acceptor_(asio::make_strand(io_context_)),
      logger_(get_logger()) {}

ConfigServer::~ConfigServer() {
    stop();
}

void ConfigServer::start() {
    if (flag_running_.exchange(true)) {
        return;
    }

    beast::error_code error;
    const auto address = asio::ip::make_address(str_listen_address_, error);
    if (error) {
        flag_running_.store(false);
        throw DeliveryError(fmt::format("Invalid listen address '{}': {}", str_listen_address_, error.message()));
    }
    const tcp::endpoint endpoint{address, listen_port_};

    const auto fail = [this, &endpoint](const char* action, const beast::error_code& failure) {
        flag_running_.store(false);
        beast::error_code ignored;
        acceptor_.close(ignored);
        throw DeliveryError(
            fmt::format("Unable to {} {}:{}: {}", action, endpoint.address().to_string(), endpoint.port(), failure.message())
        );
    };

    acceptor_.open(endpoint.protocol(), error);
    if (error) {
        fail("open listener on", error);
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), error);
    if (error) {
        fail("configure listener on", error);
    }
    acceptor_.bind(endpoint, error);
    if (error) {
        fail("bind", error);
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, error);
    if (error) {
        fail("listen on", error);
    }
    bound_port_.store(acceptor_.local_endpoint().port());

    do_accept();
    server_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"config_server","event":"io_error","error":{}}})", json_string(exc.what()));
        }
    });

    logger_->info(
        R"({{"component":"config_server","event":"listening","address":{},"port":{}}})",
        json_string(str_listen_address_),
        bound_port_.load()
    );
}

void ConfigServer::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    io_context_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    beast::error_code ignored;
    acceptor_.close(ignored);
    logger_->info(R"({"component":"config_server","event":"stopped"})");
}

std::uint16_t ConfigServer::port() const noexcept {
    return bound_port_.load();
}

void ConfigServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code error, tcp::socket socket) {
        if (error) {
            if (error == asio::error::operation_aborted || !flag_running_.load()) {
                return;
            }
            logger_->warn(R"({{"component":"config_server","event":"accept_failed","error":{}}})", json_string(error.message()));
        } else {
            std::make_shared<Session>(std::move(socket), channel_, status_board_, logger_)->run();
        }
        if (flag_running_.load()) {
            do_accept();
        }
    });
}

}  // namespace tailroute
