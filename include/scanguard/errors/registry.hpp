#pragma once

#include "scanguard/errors/classifier.hpp"
#include "scanguard/errors/types.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace scanguard::errors {

/**
 * @brief SourceType -> classifier lookup
 *
 * Unregistered types resolve to a GenericErrorClassifier for that type, so
 * classifier_for() never returns null.
 */
class ClassifierRegistry {
public:
    using ClassifierPtr = std::shared_ptr<const SourceErrorClassifier>;

    ClassifierRegistry() = default;

    /// Registry holding the WebDAV, S3, Local, Dropbox, GDrive and OneDrive classifiers
    [[nodiscard]] static std::shared_ptr<ClassifierRegistry> with_defaults();

    /// Replaces any classifier already registered for the same source type
    void register_classifier(ClassifierPtr classifier);

    [[nodiscard]] ClassifierPtr classifier_for(SourceType type) const;
    [[nodiscard]] bool has_classifier(SourceType type) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<SourceType, ClassifierPtr> classifiers_;
};

} // namespace scanguard::errors
