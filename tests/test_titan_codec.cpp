/**
 * @file test_titan_codec.cpp
 * @brief Titan请求编码与响应解码测试
 * @author cRelay Team
 * @date 2026-10-16
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "crelay/codec/titan_codec.h"
#include "crelay/common/exceptions.h"

namespace crelay {
namespace test {

TEST(TitanCodecTest, EncodeUsesFixedGenerationConfig) {
    nlohmann::json body = nlohmann::json::parse(TitanCodec::encode("Tell me a joke"));
    
    EXPECT_EQ(body["inputText"], "Tell me a joke");
    const auto& config = body["textGenerationConfig"];
    EXPECT_DOUBLE_EQ(config["temperature"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(config["topP"].get<double>(), 0.0);
    EXPECT_EQ(config["maxTokenCount"], 100);
    ASSERT_EQ(config["stopSequences"].size(), 1u);
    EXPECT_EQ(config["stopSequences"][0], "|");
}

TEST(TitanCodecTest, EncodeEscapesSpecialCharacters) {
    std::string prompt = "line1\n\"quoted\" \\ tab\t";
    nlohmann::json body = nlohmann::json::parse(TitanCodec::encode(prompt));
    EXPECT_EQ(body["inputText"], prompt);
}

TEST(TitanCodecTest, EncodeEmptyPrompt) {
    nlohmann::json body = nlohmann::json::parse(TitanCodec::encode(""));
    EXPECT_EQ(body["inputText"], "");
}

TEST(TitanCodecTest, EncodeRejectsInvalidUtf8) {
    try {
        TitanCodec::encode(std::string("bad \xff\xfe bytes"));
        FAIL() << "expected CodecException";
    } catch (const CodecException& e) {
        EXPECT_EQ(e.getError(), CodecError::ENCODING_FAILED);
    }
}

TEST(TitanCodecTest, DecodeFullResponse) {
    const std::string response = R"({
        "inputTextTokenCount": 5,
        "results": [
            {"tokenCount": 7, "outputText": "Paris is the capital.", "completionReason": "FINISH"},
            {"tokenCount": 2, "outputText": "second", "completionReason": "LENGTH"}
        ]
    })";
    
    GenerationResult result = TitanCodec::decode(response);
    EXPECT_EQ(result.inputTextTokenCount, 5);
    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0].tokenCount, 7);
    EXPECT_EQ(result.results[0].completionReason, "FINISH");
    EXPECT_EQ(TitanCodec::firstText(result), "Paris is the capital.");
}

TEST(TitanCodecTest, DecodeIgnoresUnknownFields) {
    const std::string response = R"({"inputTextTokenCount": 1, "extra": true,
        "results": [{"tokenCount": 1, "outputText": "x", "completionReason": "FINISH", "index": 0}]})";
    EXPECT_EQ(TitanCodec::firstText(TitanCodec::decode(response)), "x");
}

TEST(TitanCodecTest, DecodeRejectsMalformedResponses) {
    const char* cases[] = {
        "not json",
        "[1, 2, 3]",
        R"({"results": []})",
        R"({"inputTextTokenCount": "5", "results": []})",
        R"({"inputTextTokenCount": 5})",
        R"({"inputTextTokenCount": 5, "results": {}})",
        R"({"inputTextTokenCount": 5, "results": [{"tokenCount": 1, "outputText": 3, "completionReason": "FINISH"}]})",
        R"({"inputTextTokenCount": 5, "results": [{"tokenCount": 1.5, "outputText": "a", "completionReason": "FINISH"}]})",
        R"({"inputTextTokenCount": 5, "results": [{"tokenCount": 1, "outputText": "a"}]})",
        R"({"inputTextTokenCount": 5, "results": [{"tokenCount": 5000000000, "outputText": "a", "completionReason": "FINISH"}]})",
        R"({"inputTextTokenCount": -5000000000, "results": []})",
        R"({"inputTextTokenCount": 18446744073709551615, "results": []})",
    };
    
    for (const char* body : cases) {
        try {
            TitanCodec::decode(body);
            ADD_FAILURE() << "expected failure for: " << body;
        } catch (const CodecException& e) {
            EXPECT_EQ(e.getError(), CodecError::DECODING_FAILED) << body;
        }
    }
}

TEST(TitanCodecTest, DecodeAcceptsIntLimits) {
    GenerationResult result = TitanCodec::decode(
        R"({"inputTextTokenCount": 2147483647, "results": [{"tokenCount": 0, "outputText": "a", "completionReason": "FINISH"}]})");
    EXPECT_EQ(result.inputTextTokenCount, 2147483647);
    EXPECT_EQ(result.results[0].tokenCount, 0);
}

TEST(TitanCodecTest, FirstTextOfEmptyResults) {
    GenerationResult result = TitanCodec::decode(R"({"inputTextTokenCount": 2, "results": []})");
    try {
        TitanCodec::firstText(result);
        FAIL() << "expected CodecException";
    } catch (const CodecException& e) {
        EXPECT_EQ(e.getError(), CodecError::EMPTY_RESULT);
        EXPECT_STREQ(codecErrorName(e.getError()), "EmptyResultError");
    }
}

} // namespace test
} // namespace crelay
