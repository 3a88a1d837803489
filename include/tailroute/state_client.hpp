// === State Client ============================================================
//
// Pull interface over the mesh daemon's status query plus the LocalAPI
// implementation that talks to tailscaled through its Unix socket or a
// loopback TCP port. Each fetch is bounded by a timeout and never retried
// here; retry policy belongs to the Watch Loop.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "tailroute/device.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/status_parser.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

/** @brief Source of mesh snapshots. */
class StateClient {
  public:
    virtual ~StateClient() = default;

    /**
     * @brief Query the source once.
     * @throws SourceUnavailable on timeout, transport failure, or a body that
     *         is not a status document. An empty network is a valid snapshot.
     */
    [[nodiscard]] virtual Snapshot fetch_snapshot() = 0;

    /**
     * @brief Abort an in-flight fetch from another thread. Cancellation is
     *        permanent: later fetches fail immediately.
     */
    virtual void cancel() = 0;
};

/** @brief Where the LocalAPI listens. */
struct LocalApiEndpoint final {
    enum class Kind {
        UnixSocket, /**< Filesystem socket (Linux default). */
        Tcp         /**< Loopback port, optionally token-protected (macOS). */
    };

    Kind kind{Kind::UnixSocket};
    std::string socket_path{};          /**< Used when kind is UnixSocket. */
    std::string host{};                 /**< Used when kind is Tcp. */
    std::string port{};                 /**< Used when kind is Tcp. */
    std::optional<std::string> token{}; /**< Basic-auth password for Tcp. */

    /**
     * @brief Parse `tcp://host:port[:token]` or a socket path; an empty string
     *        selects the platform default socket.
     * @throws ConfigurationError for a malformed tcp:// endpoint.
     */
    [[nodiscard]] static LocalApiEndpoint parse(std::string_view text);

    /** @brief Endpoint description safe for logs (token redacted). */
    [[nodiscard]] std::string describe() const;
};

inline constexpr std::string_view k_default_socket_path{"/var/run/tailscale/tailscaled.sock"};

/** @brief StateClient backed by tailscaled's `/localapi/v0/status`. */
class LocalApiStateClient final : public StateClient {
  public:
    LocalApiStateClient(LocalApiEndpoint endpoint, Duration timeout, StatusParseOptions parse_options);

    [[nodiscard]] Snapshot fetch_snapshot() override;
    void cancel() override;

    /**
     * @brief Query status without peers to confirm the daemon answers.
     * @return The daemon's backend state.
     * @throws SourceUnavailable when the daemon cannot be reached.
     */
    std::string test_connection();

  private:
    /** @brief Registers the io_context of the running request for cancel(). */
    struct ContextRegistration;

    /** @brief GET @p target from the LocalAPI and return the 2xx body. */
    std::string request(const std::string& target);

    /** @brief Write the request and read the response over a connected stream. */
    template <typename Stream>
    std::string exchange(boost::asio::io_context& io_context, Stream& stream, TimePoint deadline, const std::string& target);

    /** @brief Run one asynchronous step until completion, deadline, or cancel. */
    template <typename Initiate>
    boost::system::error_code run_step(boost::asio::io_context& io_context, TimePoint deadline, Initiate&& initiate);

    LocalApiEndpoint endpoint_;
    Duration timeout_;
    StatusParseOptions parse_options_;
    std::mutex mutex_;
    boost::asio::io_context* active_context_{nullptr};
    bool flag_cancelled_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
