#include "scanguard/errors/classifier.hpp"
#include "scanguard/errors/registry.hpp"
#include "scanguard/errors/webdav_classifier.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>

using scanguard::errors::ClassifierRegistry;
using scanguard::errors::ErrorClassification;
using scanguard::errors::ErrorContext;
using scanguard::errors::Severity;
using scanguard::errors::SourceError;
using scanguard::errors::SourceErrorClassifier;
using scanguard::errors::SourceErrorType;
using scanguard::errors::SourceScanFailure;
using scanguard::errors::SourceType;

namespace {

// Classifies everything as a critical conflict so the test can tell it apart
class FixedWebDAVClassifier final : public SourceErrorClassifier {
public:
    SourceType source_type() const noexcept override { return SourceType::WebDAV; }

    ErrorClassification classify_error(const SourceError&, const ErrorContext&) const override {
        ErrorClassification classification;
        classification.error_type = SourceErrorType::Conflict;
        classification.severity = Severity::Critical;
        return classification;
    }

    nlohmann::json extract_diagnostics(const SourceError&, const ErrorContext&) const override {
        return nlohmann::json::object();
    }

    std::string build_user_friendly_message(const SourceScanFailure&) const override { return "fixed"; }
    std::string build_recommended_action(const SourceScanFailure&) const override { return "none"; }
};

} // namespace

TEST(ClassifierRegistryTest, DefaultsCoverEverySourceType) {
    auto registry = ClassifierRegistry::with_defaults();
    for (auto type : scanguard::errors::all_source_types()) {
        EXPECT_TRUE(registry->has_classifier(type)) << scanguard::errors::to_string(type);
        EXPECT_EQ(registry->classifier_for(type)->source_type(), type);
    }
}

TEST(ClassifierRegistryTest, UnregisteredTypeFallsBackToGeneric) {
    ClassifierRegistry registry;
    EXPECT_FALSE(registry.has_classifier(SourceType::Dropbox));

    auto classifier = registry.classifier_for(SourceType::Dropbox);
    ASSERT_NE(classifier, nullptr);
    EXPECT_EQ(classifier->source_type(), SourceType::Dropbox);

    auto result = classifier->classify_error(SourceError("not found"), ErrorContext("/Apps/x"));
    EXPECT_EQ(result.error_type, SourceErrorType::NotFound);
    EXPECT_EQ(result.severity, Severity::Critical);
}

TEST(ClassifierRegistryTest, RegisterReplacesExisting) {
    auto registry = ClassifierRegistry::with_defaults();
    registry->register_classifier(std::make_shared<FixedWebDAVClassifier>());

    auto result = registry->classifier_for(SourceType::WebDAV)
        ->classify_error(SourceError("timeout"), ErrorContext("/remote"));
    EXPECT_EQ(result.error_type, SourceErrorType::Conflict);

    registry->register_classifier(nullptr);
    EXPECT_TRUE(registry->has_classifier(SourceType::WebDAV));
}

TEST(ClassifierRegistryTest, ConcurrentLookupsAndRegistration) {
    auto registry = ClassifierRegistry::with_defaults();
    std::atomic<int> lookups{0};

    boost::asio::thread_pool pool(4);
    for (int i = 0; i < 200; ++i) {
        boost::asio::post(pool, [&, i] {
            if (i % 50 == 0) {
                registry->register_classifier(std::make_shared<scanguard::errors::WebDAVErrorClassifier>());
            }
            if (registry->classifier_for(SourceType::WebDAV)) {
                ++lookups;
            }
        });
    }
    pool.join();

    EXPECT_EQ(lookups.load(), 200);
}
