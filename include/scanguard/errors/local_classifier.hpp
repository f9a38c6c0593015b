#pragma once

#include "scanguard/errors/classifier.hpp"

namespace scanguard::errors {

/**
 * @brief Classifier for local and mounted filesystems (errno / OS error text)
 */
class LocalErrorClassifier final : public SourceErrorClassifier {
public:
    [[nodiscard]] SourceType source_type() const noexcept override { return SourceType::Local; }

    [[nodiscard]] ErrorClassification classify_error(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] nlohmann::json extract_diagnostics(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] std::string build_user_friendly_message(const SourceScanFailure& failure) const override;
    [[nodiscard]] std::string build_recommended_action(const SourceScanFailure& failure) const override;
};

} // namespace scanguard::errors
