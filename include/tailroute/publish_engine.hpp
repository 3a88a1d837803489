// === Publish Engine ==========================================================
//
// Diff and debounce stage between translation and delivery. Identical
// documents are suppressed; bursts of changes inside the debounce window are
// coalesced so only the latest one is delivered when the window expires.
// Published state changes only after the delivery channel accepted it.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "tailroute/delivery_channel.hpp"
#include "tailroute/dynamic_config.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/types.hpp"

namespace tailroute {

enum class PublishDecision {
    Publish,   /**< Delivered now. */
    Suppress,  /**< Equal to the published document. */
    Deferred   /**< Held until the debounce window expires. */
};

[[nodiscard]] std::string_view to_string(PublishDecision decision) noexcept;

class PublishEngine final {
  public:
    PublishEngine(Duration debounce_window, DeliveryChannel& channel);

    /**
     * @brief Decide what to do with a freshly translated document.
     * @throws TranslationInvariantViolation if @p document fails validation.
     * @throws DeliveryError when an immediate publish could not be delivered;
     *         published state is unchanged in both cases. A held document is
     *         dropped by an immediate publish attempt even if it fails.
     */
    PublishDecision consider(const ConfigurationDocument& document, TimePoint now);

    /**
     * @brief Publish the held document once its window has expired.
     * @return True when a document was delivered.
     * @throws DeliveryError as consider(); the document stays held.
     */
    bool flush_due(TimePoint now);

    /** @brief When the held document becomes due; empty when nothing is held. */
    [[nodiscard]] std::optional<TimePoint> pending_deadline() const noexcept;

    /** @brief Last successful publish; null before the first one. */
    [[nodiscard]] PublishedConfigurationPtr published() const noexcept;

  private:
    void publish(const ConfigurationDocument& document, TimePoint now);

    Duration debounce_window_;
    DeliveryChannel& channel_;
    PublishedConfigurationPtr published_{};
    std::optional<ConfigurationDocument> pending_{};
    std::optional<TimePoint> last_publish_at_{};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tailroute
