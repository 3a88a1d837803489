// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. The console sink
// prints plain messages; the rotating file sink writes one JSON line per
// message. Components log structured events as inline JSON objects and pass
// free text through json_string(); plain messages become a JSON string.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace tailroute {

/**
 * @brief Create the shared logger writing to @p log_directory. Later calls
 *        return the existing logger.
 * @throws std::runtime_error when the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error before initialize_logger() ran. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Quote and escape @p text as a JSON string literal for inline events. */
[[nodiscard]] std::string json_string(std::string_view text);

}  // namespace tailroute
