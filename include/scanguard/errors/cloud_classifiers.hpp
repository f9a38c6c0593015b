#pragma once

#include "scanguard/errors/classifier.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace scanguard::errors {

/**
 * @brief Shared classifier for cloud-drive REST APIs
 *
 * Provider error tags (e.g. Dropbox "path/not_found", Graph "itemNotFound")
 * are checked first, in table order; the HTTP status vocabulary common to
 * all three providers is the fallback. A "retry after N" hint in the error
 * text lengthens the rate-limit delay.
 */
class CloudDriveErrorClassifier : public SourceErrorClassifier {
public:
    /// Lower-cased token and the type it maps to
    using Vocabulary = std::vector<std::pair<std::string_view, SourceErrorType>>;

    [[nodiscard]] ErrorClassification classify_error(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] nlohmann::json extract_diagnostics(const SourceError& error,
                                                     const ErrorContext& context) const override;
    [[nodiscard]] std::string build_user_friendly_message(const SourceScanFailure& failure) const override;
    [[nodiscard]] std::string build_recommended_action(const SourceScanFailure& failure) const override;

protected:
    /// Name shown in user-facing messages
    [[nodiscard]] virtual std::string_view display_name() const noexcept = 0;
    [[nodiscard]] virtual const Vocabulary& vocabulary() const = 0;

private:
    [[nodiscard]] SourceErrorType classify_type(const std::string& lowered) const;
};

class DropboxErrorClassifier final : public CloudDriveErrorClassifier {
public:
    [[nodiscard]] SourceType source_type() const noexcept override { return SourceType::Dropbox; }

protected:
    [[nodiscard]] std::string_view display_name() const noexcept override { return "Dropbox"; }
    [[nodiscard]] const Vocabulary& vocabulary() const override;
};

class GDriveErrorClassifier final : public CloudDriveErrorClassifier {
public:
    [[nodiscard]] SourceType source_type() const noexcept override { return SourceType::GDrive; }

protected:
    [[nodiscard]] std::string_view display_name() const noexcept override { return "Google Drive"; }
    [[nodiscard]] const Vocabulary& vocabulary() const override;
};

class OneDriveErrorClassifier final : public CloudDriveErrorClassifier {
public:
    [[nodiscard]] SourceType source_type() const noexcept override { return SourceType::OneDrive; }

protected:
    [[nodiscard]] std::string_view display_name() const noexcept override { return "OneDrive"; }
    [[nodiscard]] const Vocabulary& vocabulary() const override;
};

} // namespace scanguard::errors
