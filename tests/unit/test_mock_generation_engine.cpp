#include <gtest/gtest.h>
#include "mt/mock_generation_engine.hpp"
#include <chrono>
#include <string>
#include <vector>

using namespace livetranslate::mt;

class MockGenerationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<MockGenerationEngine>(std::chrono::milliseconds(0));
        ASSERT_TRUE(engine->initialize());
    }

    std::vector<std::string> collect(const std::string& text) {
        std::vector<std::string> chunks;
        engine->generateStreaming(text, [&chunks](const std::string& chunk) {
            chunks.push_back(chunk);
            return true;
        });
        return chunks;
    }

    std::unique_ptr<MockGenerationEngine> engine;
};

TEST_F(MockGenerationEngineTest, ReadyAfterInitialize) {
    MockGenerationEngine fresh;
    EXPECT_FALSE(fresh.isReady());
    EXPECT_TRUE(engine->isReady());
    EXPECT_TRUE(engine->supportsStreaming());
    EXPECT_EQ(engine->getName(), "mock");
}

TEST_F(MockGenerationEngineTest, TranslatesKnownAndUnknownWords) {
    EXPECT_EQ(MockGenerationEngine::translate("Bonjour le monde"), "hello [le] [monde]");
    EXPECT_EQ(MockGenerationEngine::translate("Je suis tres bien"), "I am very well");
    EXPECT_EQ(MockGenerationEngine::translate("  OUI   non  "), "yes no");
    EXPECT_EQ(MockGenerationEngine::translate(""), "");
}

TEST_F(MockGenerationEngineTest, PunctuationOnlyAffectsLookup) {
    EXPECT_EQ(MockGenerationEngine::translate("Bonjour, comment allez-vous?"), "hello how [allez-vous?]");
    EXPECT_EQ(MockGenerationEngine::translate("Merci!"), "thank you");
}

TEST_F(MockGenerationEngineTest, GenerateMatchesTranslate) {
    EXPECT_EQ(engine->generate("Bonjour le monde"), "hello [le] [monde]");
}

TEST_F(MockGenerationEngineTest, StreamsOneWordPerChunk) {
    auto chunks = collect("Bonjour le monde");

    EXPECT_EQ(chunks, (std::vector<std::string>{"hello ", "[le] ", "[monde] "}));
}

TEST_F(MockGenerationEngineTest, MultiWordTranslationsSplit) {
    auto chunks = collect("merci");

    EXPECT_EQ(chunks, (std::vector<std::string>{"thank ", "you "}));
}

TEST_F(MockGenerationEngineTest, StopsWhenCallbackDeclines) {
    std::vector<std::string> chunks;
    engine->generateStreaming("je suis bien", [&chunks](const std::string& chunk) {
        chunks.push_back(chunk);
        return false;
    });

    EXPECT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks.front(), "I ");
}

TEST_F(MockGenerationEngineTest, ChunkDelayIsApplied) {
    MockGenerationEngine slow(std::chrono::milliseconds(20));
    ASSERT_TRUE(slow.initialize());

    auto start = std::chrono::steady_clock::now();
    slow.generateStreaming("oui non bien", [](const std::string&) { return true; });
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

TEST_F(MockGenerationEngineTest, NoBreakSpaceSeparatesWords) {
    EXPECT_EQ(engine->translate("Merci\xC2\xA0!"), "thank you [!]");
    EXPECT_EQ(collect("Bonjour\xC2\xA0le"), (std::vector<std::string>{"hello ", "[le] "}));
}
