#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mt/language_classifier.hpp"
#include "utils/error_handler.hpp"
#include <memory>
#include <stdexcept>

using namespace livetranslate::mt;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockLanguageDetector : public LanguageDetector {
public:
    MOCK_METHOD(std::vector<LanguageCandidate>, detectLanguages, (const std::string& text), (override));
    MOCK_METHOD(bool, isInitialized, (), (const, override));
};

} // namespace

class LanguageClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector = std::make_shared<TextLanguageDetector>();
        ASSERT_TRUE(detector->initialize());
        classifier = std::make_unique<LanguageClassifier>(detector, "fr");
    }

    std::shared_ptr<TextLanguageDetector> detector;
    std::unique_ptr<LanguageClassifier> classifier;
};

TEST_F(LanguageClassifierTest, FrenchSentenceIsStatistical) {
    auto result = classifier->classify("Bonjour le monde");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_GT(result.confidence, 0.5f);
    EXPECT_EQ(result.detectedLanguage, "fr");
    EXPECT_EQ(result.method, "statistical");
    EXPECT_EQ(result.text, "Bonjour le monde");
}

TEST_F(LanguageClassifierTest, EnglishSentenceIsNotFrench) {
    auto result = classifier->classify("Hello my friend, how are you");

    EXPECT_FALSE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
    EXPECT_EQ(result.detectedLanguage, "en");
    EXPECT_EQ(result.method, "statistical");
}

TEST_F(LanguageClassifierTest, ShortTextUsesLexicon) {
    auto result = classifier->classify("Bonjour");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 1.0f);
    EXPECT_EQ(result.method, "lexical_fallback");
    EXPECT_TRUE(result.detectedLanguage.empty());
}

TEST_F(LanguageClassifierTest, FallbackRatio) {
    auto result = classifier->classifyWithFallback("Je suis content");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_NEAR(result.confidence, 2.0f / 3.0f, 1e-5);
}

TEST_F(LanguageClassifierTest, FallbackIsCaseInsensitive) {
    auto result = classifier->classifyWithFallback("BONJOUR MERCI OUI");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 1.0f);
}

TEST_F(LanguageClassifierTest, FallbackDoesNotStripPunctuation) {
    auto result = classifier->classifyWithFallback("bonjour!");

    EXPECT_FALSE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST_F(LanguageClassifierTest, FallbackThresholdIsStrict) {
    // 3 hits out of 10 tokens is exactly the threshold
    auto result = classifier->classifyWithFallback("je tu il a b c d e f g");

    EXPECT_NEAR(result.confidence, 0.3f, 1e-6);
    EXPECT_FALSE(result.isTargetLanguage);
}

TEST_F(LanguageClassifierTest, EmptyTextFallback) {
    auto result = classifier->classifyWithFallback("   ");

    EXPECT_FALSE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST(LanguageClassifierMockTest, ThrowingDetectorFallsBack) {
    auto mock = std::make_shared<MockLanguageDetector>();
    EXPECT_CALL(*mock, isInitialized()).WillRepeatedly(Return(true));
    EXPECT_CALL(*mock, detectLanguages(_))
        .WillOnce(Throw(livetranslate::utils::DetectionException("detector failed")));

    LanguageClassifier classifier(mock);
    auto result = classifier.classify("Je suis content");
    auto expected = classifier.classifyWithFallback("Je suis content");

    EXPECT_EQ(result.isTargetLanguage, expected.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, expected.confidence);
    EXPECT_EQ(result.method, "lexical_fallback");
}

TEST(LanguageClassifierMockTest, ForeignExceptionFallsBack) {
    auto mock = std::make_shared<MockLanguageDetector>();
    EXPECT_CALL(*mock, isInitialized()).WillRepeatedly(Return(true));
    EXPECT_CALL(*mock, detectLanguages(_)).WillOnce(Throw(std::runtime_error("model crashed")));

    LanguageClassifier classifier(mock);
    EXPECT_NO_THROW({
        auto result = classifier.classify("oui merci");
        EXPECT_TRUE(result.isTargetLanguage);
    });
}

TEST(LanguageClassifierMockTest, UninitializedDetectorIsSkipped) {
    auto mock = std::make_shared<MockLanguageDetector>();
    EXPECT_CALL(*mock, isInitialized()).WillRepeatedly(Return(false));
    EXPECT_CALL(*mock, detectLanguages(_)).Times(0);

    LanguageClassifier classifier(mock);
    auto result = classifier.classify("nous sommes");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_EQ(result.method, "lexical_fallback");
}

TEST(LanguageClassifierMockTest, TargetMissingFromCandidates) {
    auto mock = std::make_shared<MockLanguageDetector>();
    EXPECT_CALL(*mock, isInitialized()).WillRepeatedly(Return(true));
    EXPECT_CALL(*mock, detectLanguages(_))
        .WillOnce(Return(std::vector<LanguageCandidate>{{"es", 0.7f}, {"en", 0.3f}}));

    LanguageClassifier classifier(mock);
    auto result = classifier.classify("la casa es grande");

    EXPECT_FALSE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
    EXPECT_EQ(result.detectedLanguage, "es");
}

TEST(LanguageClassifierMockTest, TargetProbabilityIsClamped) {
    auto mock = std::make_shared<MockLanguageDetector>();
    EXPECT_CALL(*mock, isInitialized()).WillRepeatedly(Return(true));
    EXPECT_CALL(*mock, detectLanguages(_))
        .WillOnce(Return(std::vector<LanguageCandidate>{{"fr", 1.4f}}));

    LanguageClassifier classifier(mock);
    auto result = classifier.classify("peu importe");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 1.0f);
}

TEST(LanguageClassifierMockTest, NullDetectorUsesLexicon) {
    LanguageClassifier classifier(nullptr);
    auto result = classifier.classify("merci");

    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_EQ(classifier.getTargetLanguage(), "fr");
}

TEST(LanguageClassifierFallbackTest, NoBreakSpaceSeparatesWords) {
    LanguageClassifier lexiconOnly(nullptr, "fr");

    // "Bonjour !" and "Merci beaucoup ?" with French no-break spaces
    auto result = lexiconOnly.classify("Bonjour\xC2\xA0!");
    EXPECT_TRUE(result.isTargetLanguage);
    EXPECT_FLOAT_EQ(result.confidence, 0.5f);

    result = lexiconOnly.classify("Merci\xE2\x80\xAF?");
    EXPECT_FLOAT_EQ(result.confidence, 0.5f);
}
