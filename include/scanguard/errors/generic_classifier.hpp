#pragma once

#include "scanguard/errors/classifier.hpp"

namespace scanguard::errors {

/**
 * @brief Fallback for source types with no registered classifier
 *
 * Knows only the vocabulary every transport shares (timeouts, auth
 * failures, missing resources, network and 5xx errors, throttling).
 */
class GenericErrorClassifier final : public SourceErrorClassifier {
public:
    explicit GenericErrorClassifier(SourceType source_type) noexcept : source_type_(source_type) {}

    [[nodiscard]] SourceType source_type() const noexcept override { return source_type_; }

    [[nodiscard]] ErrorClassification classify_error(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] nlohmann::json extract_diagnostics(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] std::string build_user_friendly_message(const SourceScanFailure& failure) const override;
    [[nodiscard]] std::string build_recommended_action(const SourceScanFailure& failure) const override;

    /**
     * @brief Message with failure-count and retry-time hints relative to @p now
     *
     * Appends " This has failed N times." once consecutive failures exceed
     * one, and " Will retry in N minutes." or " Ready for retry." while a
     * retry is scheduled.
     */
    [[nodiscard]] std::string build_user_friendly_message_at(const SourceScanFailure& failure, TimePoint now) const;

private:
    SourceType source_type_;
};

} // namespace scanguard::errors
