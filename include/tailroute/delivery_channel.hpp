// === Delivery Channel ========================================================
//
// Hands a published configuration to the reverse proxy. Pull mode keeps the
// latest configuration for the HTTP endpoint; file mode replaces a watched
// file atomically. Both finish before deliver() returns.

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "tailroute/dynamic_config.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

/** @brief Immutable value of the last successful publish. */
struct PublishedConfiguration final {
    ConfigurationDocument document{};
    std::string body{};          /**< Serialized document. */
    std::uint64_t version{};     /**< Starts at 1, +1 per publish. */
    std::string etag{};          /**< Quoted version, e.g. "\"3\"". */
    SystemTimePoint published_at{};
};

using PublishedConfigurationPtr = std::shared_ptr<const PublishedConfiguration>;

class DeliveryChannel {
  public:
    virtual ~DeliveryChannel() = default;

    /**
     * @brief Make @p published visible to the proxy.
     * @throws DeliveryError when it could not be made visible.
     */
    virtual void deliver(const PublishedConfigurationPtr& published) = 0;
};

/** @brief Pull mode: readers fetch the current value without locking. */
class HttpDeliveryChannel final : public DeliveryChannel {
  public:
    void deliver(const PublishedConfigurationPtr& published) override;

    /** @brief Latest delivered configuration; null before the first publish. */
    [[nodiscard]] PublishedConfigurationPtr current() const noexcept;

  private:
    std::atomic<PublishedConfigurationPtr> current_{};
};

/** @brief File mode: write to a sibling temp file, flush, rename over the target. */
class FileDeliveryChannel final : public DeliveryChannel {
  public:
    explicit FileDeliveryChannel(std::filesystem::path path_output);

    void deliver(const PublishedConfigurationPtr& published) override;

    [[nodiscard]] const std::filesystem::path& output_path() const noexcept;

  private:
    std::filesystem::path path_output_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
