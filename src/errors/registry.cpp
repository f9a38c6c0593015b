#include "scanguard/errors/registry.hpp"

#include "scanguard/errors/cloud_classifiers.hpp"
#include "scanguard/errors/generic_classifier.hpp"
#include "scanguard/errors/local_classifier.hpp"
#include "scanguard/errors/s3_classifier.hpp"
#include "scanguard/errors/webdav_classifier.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace scanguard::errors {

std::shared_ptr<ClassifierRegistry> ClassifierRegistry::with_defaults() {
    auto registry = std::make_shared<ClassifierRegistry>();
    registry->register_classifier(std::make_shared<WebDAVErrorClassifier>());
    registry->register_classifier(std::make_shared<S3ErrorClassifier>());
    registry->register_classifier(std::make_shared<LocalErrorClassifier>());
    registry->register_classifier(std::make_shared<DropboxErrorClassifier>());
    registry->register_classifier(std::make_shared<GDriveErrorClassifier>());
    registry->register_classifier(std::make_shared<OneDriveErrorClassifier>());
    return registry;
}

void ClassifierRegistry::register_classifier(ClassifierPtr classifier) {
    if (!classifier) {
        return;
    }
    const auto type = classifier->source_type();
    {
        std::unique_lock lock(mutex_);
        classifiers_[type] = std::move(classifier);
    }
    spdlog::debug("[ClassifierRegistry] registered classifier for {}", to_string(type));
}

ClassifierRegistry::ClassifierPtr ClassifierRegistry::classifier_for(SourceType type) const {
    {
        std::shared_lock lock(mutex_);
        auto it = classifiers_.find(type);
        if (it != classifiers_.end()) {
            return it->second;
        }
    }
    return std::make_shared<GenericErrorClassifier>(type);
}

bool ClassifierRegistry::has_classifier(SourceType type) const {
    std::shared_lock lock(mutex_);
    return classifiers_.count(type) > 0;
}

} // namespace scanguard::errors
