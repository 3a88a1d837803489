// === Error Taxonomy ==========================================================
//
// Exception types raised across the pipeline. The Watch Loop dispatches on
// the concrete type: SourceUnavailable triggers backoff, translation and
// delivery errors keep the last published configuration, and configuration
// errors abort startup.

#pragma once

#include <stdexcept>
#include <string>

namespace tailroute {

/** @brief Common base for every provider error. */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The mesh state source failed, timed out, or answered garbage. */
class SourceUnavailable final : public Error {
  public:
    using Error::Error;
};

/** @brief A selection rule or rule file is malformed. */
class SelectionConfigError final : public Error {
  public:
    using Error::Error;
};

/** @brief A translated document broke a naming or reference invariant. */
class TranslationInvariantViolation final : public Error {
  public:
    using Error::Error;
};

/** @brief The configuration could not be written or exposed. */
class DeliveryError final : public Error {
  public:
    using Error::Error;
};

/** @brief The process environment holds an unusable setting. */
class ConfigurationError final : public Error {
  public:
    using Error::Error;
};

}  // namespace tailroute
