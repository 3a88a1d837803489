#include "tailroute/publish_engine.hpp"

#include <fmt/format.h>

#include "tailroute/config_translator.hpp"

namespace tailroute {

std::string_view to_string(PublishDecision decision) noexcept {
    switch (decision) {
        case PublishDecision::Publish:
            return "publish";
        case PublishDecision::Suppress:
            return "suppress";
        case PublishDecision::Deferred:
            return "deferred";
    }
    return "unknown";
}

PublishEngine::PublishEngine(Duration debounce_window, DeliveryChannel& channel)
    : debounce_window_(debounce_window), channel_(channel), logger_(get_logger()) {}

PublishDecision PublishEngine::consider(const ConfigurationDocument& document, TimePoint now) {
    if (published_ && published_->document == document) {
        if (pending_) {
            logger_->debug(R"({{"component":"publish_engine","event":"pending_dropped"}})");
            pending_.reset();
        }
        return PublishDecision::Suppress;
    }

    if (!last_publish_at_ || now - *last_publish_at_ >= debounce_window_) {
        // The fresh document supersedes anything held, delivered or not.
        pending_.reset();
        publish(document, now);
        return PublishDecision::Publish;
    }

    validate_document(document);
    pending_ = document;
    logger_->debug(
        R"({{"component":"publish_engine","event":"deferred","due_in_ms":{}}})",
        std::chrono::duration_cast<Duration>(*last_publish_at_ + debounce_window_ - now).count()
    );
    return PublishDecision::Deferred;
}

bool PublishEngine::flush_due(TimePoint now) {
    const auto deadline = pending_deadline();
    if (!deadline || now < *deadline) {
        return false;
    }
    publish(*pending_, now);
    pending_.reset();
    return true;
}

std::optional<TimePoint> PublishEngine::pending_deadline() const noexcept {
    if (!pending_) {
        return std::nullopt;
    }
    if (!last_publish_at_) {
        return TimePoint{};
    }
    return *last_publish_at_ + debounce_window_;
}

PublishedConfigurationPtr PublishEngine::published() const noexcept {
    return published_;
}

void PublishEngine::publish(const ConfigurationDocument& document, TimePoint now) {
    validate_document(document);

    const std::uint64_t version = published_ ? published_->version + 1 : 1;
    auto next = std::make_shared<PublishedConfiguration>();
    next->document = document;
    next->body = serialize(document);
    next->version = version;
    next->etag = fmt::format("\"{}\"", version);
    next->published_at = SystemClock::now();

    PublishedConfigurationPtr candidate = std::move(next);
    channel_.deliver(candidate);

    published_ = std::move(candidate);
    last_publish_at_ = now;
    logger_->info(
        R"({{"component":"publish_engine","event":"published","version":{},"routers":{},"bytes":{}}})",
        version,
        published_->document.router_count(),
        published_->body.size()
    );
}

}  // namespace tailroute
