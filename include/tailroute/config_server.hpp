// === Config Server ===========================================================
//
// HTTP endpoint polled by Traefik's HTTP provider. Runs its own io_context on
// a dedicated thread and reads the published configuration from the delivery
// channel without locking, so a response always carries one complete
// document.
//
//   GET /        health
//   GET /config  current document (ETag / If-None-Match aware)
//   GET /status  pipeline diagnostics

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "tailroute/delivery_channel.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/status_board.hpp"

namespace tailroute {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief Answer one request from the current published value and status.
 *        Pure; the server calls it for every request.
 */
[[nodiscard]] HttpResponse handle_config_request(
    const HttpRequest& request,
    const PublishedConfigurationPtr& published,
    const PipelineStatus& status
);

class ConfigServer final {
  public:
    ConfigServer(std::string listen_address, std::uint16_t listen_port, const HttpDeliveryChannel& channel, const StatusBoard& status_board);
    ~ConfigServer();

    ConfigServer(const ConfigServer&) = delete;
    ConfigServer& operator=(const ConfigServer&) = delete;

    /**
     * @brief Bind, listen, and start serving on the server thread.
     * @throws DeliveryError when the address cannot be bound.
     */
    void start();

    /** @brief Close the listener and join the server thread. */
    void stop();

    /** @brief Bound port; differs from the requested one when that was 0. */
    [[nodiscard]] std::uint16_t port() const noexcept;

  private:
    class Session;

    void do_accept();

    std::string str_listen_address_;
    std::uint16_t listen_port_;
    const HttpDeliveryChannel& channel_;
    const StatusBoard& status_board_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread server_thread_;
    std::atomic<bool> flag_running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
