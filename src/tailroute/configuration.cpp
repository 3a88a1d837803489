// === Configuration Loader ====================================================
//
// Turns `TAILROUTE_*` environment variables into the Configuration consumed by
// the runtime. Numbers and flags that cannot be parsed fall back to their
// defaults with a warning; a missing rule file path, an unknown delivery mode
// or a malformed endpoint or tag mapping stop startup with a
// ConfigurationError.
//
// Tag defaults: TAILROUTE_DEFAULT_PORT gives bare `name` tags a port,
// TAILROUTE_DEFAULT_PROTOCOL and TAILROUTE_DEFAULT_SCHEME complete
// `name-port` tags.

#include "tailroute/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "tailroute/errors.hpp"
#include "tailroute/logging.hpp"

namespace tailroute {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr long long k_default_fetch_timeout_ms{5000};
constexpr long long k_default_poll_interval_s{30};
constexpr long long k_default_backoff_max_s{300};
constexpr long long k_default_debounce_ms{2000};
constexpr std::string_view k_default_listen_address{"0.0.0.0"};
constexpr long long k_default_listen_port{8080};
constexpr std::string_view k_default_output_path{"tailroute.json"};
constexpr std::string_view k_default_name_prefix{"tailscale"};
constexpr std::string_view k_default_scheme{"http"};

std::string lower(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return lowered;
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

/** @brief Reads one variable at a time and reports fallbacks. */
class EnvironmentReader final {
  public:
    explicit EnvironmentReader(const EnvironmentLookup& lookup) : lookup_(lookup), logger_(get_logger()) {}

    /** @brief Trimmed value; empty when unset or blank. */
    [[nodiscard]] std::string string(const char* name) const {
        const char* raw_value = lookup_(name);
        if (raw_value == nullptr) {
            return {};
        }
        return trim(raw_value);
    }

    [[nodiscard]] std::string string_or(const char* name, std::string_view fallback) const {
        std::string value = string(name);
        return value.empty() ? std::string{fallback} : value;
    }

    /** @brief Positive integer; falls back on parse errors and values outside [1, maximum]. */
    [[nodiscard]] long long positive(const char* name, long long fallback, long long maximum = 1'000'000'000) const {
        const std::string value = string(name);
        if (value.empty()) {
            return fallback;
        }
        try {
            std::size_t consumed = 0;
            const long long parsed_value = std::stoll(value, &consumed);
            if (consumed != value.size() || parsed_value <= 0 || parsed_value > maximum) {
                throw std::out_of_range(value);
            }
            return parsed_value;
        } catch (const std::exception&) {
            logger_->warn("Failed to parse {}='{}' as a positive integer; using fallback {}", name, value, fallback);
            return fallback;
        }
    }

    [[nodiscard]] bool flag(const char* name, bool fallback) const {
        const std::string value = lower(string(name));
        if (value.empty()) {
            return fallback;
        }
        if (value == "1" || value == "true" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "0" || value == "false" || value == "no" || value == "off") {
            return false;
        }
        logger_->warn("Failed to parse {}='{}' as a boolean; using fallback {}", name, value, fallback);
        return fallback;
    }

    [[nodiscard]] std::vector<std::string> list(const char* name) const {
        std::vector<std::string> list_values;
        std::stringstream stream{string(name)};
        std::string item;
        while (std::getline(stream, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                list_values.push_back(item);
            }
        }
        return list_values;
    }

  private:
    const EnvironmentLookup& lookup_;
    std::shared_ptr<spdlog::logger> logger_;
};

TagDefaults read_tag_defaults(const EnvironmentReader& reader, spdlog::logger& logger) {
    TagDefaults defaults{};
    if (const long long port = reader.positive("TAILROUTE_DEFAULT_PORT", 0, 65535); port > 0) {
        defaults.port = static_cast<std::uint16_t>(port);
    }

    const std::string protocol_name = lower(reader.string_or("TAILROUTE_DEFAULT_PROTOCOL", "http"));
    if (protocol_name == "http" || protocol_name == "tcp" || protocol_name == "udp") {
        defaults.protocol = parse_protocol(protocol_name).value_or(Protocol::Http);
    } else {
        logger.warn("TAILROUTE_DEFAULT_PROTOCOL must be http, tcp or udp, got '{}'; using http", protocol_name);
    }

    const std::string scheme = lower(reader.string_or("TAILROUTE_DEFAULT_SCHEME", k_default_scheme));
    if (scheme == "http" || scheme == "https") {
        defaults.scheme = scheme;
    } else {
        logger.warn("TAILROUTE_DEFAULT_SCHEME must be http or https, got '{}'; using http", scheme);
    }
    return defaults;
}

std::string log_directory_from(const EnvironmentLookup& lookup) {
    const char* raw_directory = lookup("TAILROUTE_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

DeliveryMode parse_delivery_mode(const std::string& value) {
    const std::string mode = lower(value);
    if (mode == "http") {
        return DeliveryMode::Http;
    }
    if (mode == "file") {
        return DeliveryMode::File;
    }
    throw ConfigurationError(fmt::format("TAILROUTE_DELIVERY_MODE must be 'http' or 'file', got '{}'", value));
}

void validate_name_prefix(const std::string& prefix) {
    const bool valid = !prefix.empty() && std::all_of(prefix.begin(), prefix.end(), [](unsigned char character) {
        return std::isalnum(character) != 0 || character == '-';
    });
    if (!valid) {
        throw ConfigurationError(fmt::format("TAILROUTE_NAME_PREFIX must match [A-Za-z0-9-]+, got '{}'", prefix));
    }
}

}  // namespace

Configuration ConfigurationLoader::load() {
    return load([](const char* name) -> const char* { return std::getenv(name); });
}

Configuration ConfigurationLoader::load(const EnvironmentLookup& lookup) {
    Configuration config{};
    config.log_directory = log_directory_from(lookup);

    auto logger = initialize_logger(config.log_directory);
    const EnvironmentReader reader{lookup};
    config.log_level = reader.string_or("TAILROUTE_LOG_LEVEL", k_default_log_level);
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    config.endpoint = LocalApiEndpoint::parse(reader.string("TAILROUTE_SOCKET_PATH"));
    config.fetch_timeout = Duration{reader.positive("TAILROUTE_FETCH_TIMEOUT_MS", k_default_fetch_timeout_ms)};
    config.poll_interval = std::chrono::seconds{reader.positive("TAILROUTE_POLL_INTERVAL_S", k_default_poll_interval_s)};
    config.backoff_max = std::chrono::seconds{reader.positive("TAILROUTE_BACKOFF_MAX_S", k_default_backoff_max_s)};
    if (config.backoff_max < config.poll_interval) {
        logger->warn("TAILROUTE_BACKOFF_MAX_S is below the poll interval; using the poll interval");
        config.backoff_max = config.poll_interval;
    }
    config.debounce_window = Duration{reader.positive("TAILROUTE_DEBOUNCE_MS", k_default_debounce_ms)};

    config.delivery_mode = parse_delivery_mode(reader.string_or("TAILROUTE_DELIVERY_MODE", "http"));
    config.listen_address = reader.string_or("TAILROUTE_LISTEN_ADDRESS", k_default_listen_address);
    config.listen_port = static_cast<std::uint16_t>(reader.positive("TAILROUTE_LISTEN_PORT", k_default_listen_port, 65535));
    config.output_path = reader.string_or("TAILROUTE_OUTPUT_PATH", k_default_output_path);

    const std::string rules_path = reader.string("TAILROUTE_RULES_PATH");
    if (rules_path.empty()) {
        throw ConfigurationError("TAILROUTE_RULES_PATH is required");
    }
    config.rules_path = rules_path;

    config.translator.name_prefix = reader.string_or("TAILROUTE_NAME_PREFIX", k_default_name_prefix);
    validate_name_prefix(config.translator.name_prefix);

    config.status.include_self = reader.flag("TAILROUTE_INCLUDE_SELF", false);
    config.status.tag_ports = parse_tag_port_mapping(reader.string("TAILROUTE_TAG_PORT_MAPPING"));
    config.status.tag_defaults = read_tag_defaults(reader, *logger);

    config.filter.exclude_exit_nodes = reader.flag("TAILROUTE_EXCLUDE_EXIT_NODES", true);
    config.filter.exclude_expired = reader.flag("TAILROUTE_EXCLUDE_EXPIRED", true);
    config.filter.exclude_hostnames = reader.list("TAILROUTE_EXCLUDE_HOSTNAMES");
    config.filter.include_os = reader.list("TAILROUTE_INCLUDE_OS");
    if (const long long max_inactive_s = reader.positive("TAILROUTE_MAX_INACTIVE_S", 0); max_inactive_s > 0) {
        config.filter.max_inactive = std::chrono::seconds{max_inactive_s};
    }

    logger->info(
        "Configuration loaded: endpoint={} delivery={} poll_interval_s={} debounce_ms={} rules={}",
        config.endpoint.describe(),
        config.delivery_mode == DeliveryMode::Http ? "http" : "file",
        std::chrono::duration_cast<std::chrono::seconds>(config.poll_interval).count(),
        config.debounce_window.count(),
        config.rules_path.string()
    );
    return config;
}

}  // namespace tailroute
