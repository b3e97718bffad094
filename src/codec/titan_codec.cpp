#include "crelay/codec/titan_codec.h"
#include "crelay/common/exceptions.h"
#include <cstdint>
#include <limits>

namespace crelay {

namespace {

const nlohmann::json& requireField(const nlohmann::json& object, const char* key, const char* context) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw CodecException(CodecError::DECODING_FAILED,
                             std::string("missing field '") + key + "' in " + context);
    }
    return *it;
}

int requireInt(const nlohmann::json& object, const char* key, const char* context) {
    const nlohmann::json& value = requireField(object, key, context);
    if (!value.is_number_integer()) {
        throw CodecException(CodecError::DECODING_FAILED,
                             std::string("field '") + key + "' in " + context + " must be an integer");
    }
    // 非负数按无符号解析
    bool inRange;
    if (value.is_number_unsigned()) {
        inRange = value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    } else {
        const int64_t v = value.get<int64_t>();
        inRange = v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    }
    if (!inRange) {
        throw CodecException(CodecError::DECODING_FAILED,
                             std::string("field '") + key + "' in " + context + " is out of range");
    }
    return value.get<int>();
}

std::string requireString(const nlohmann::json& object, const char* key, const char* context) {
    const nlohmann::json& value = requireField(object, key, context);
    if (!value.is_string()) {
        throw CodecException(CodecError::DECODING_FAILED,
                             std::string("field '") + key + "' in " + context + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const TextGenerationConfig& config) {
    j = nlohmann::json{
        {"temperature", config.temperature},
        {"topP", config.topP},
        {"maxTokenCount", config.maxTokenCount},
        {"stopSequences", config.stopSequences}
    };
}

void to_json(nlohmann::json& j, const GenerationRequest& request) {
    j = nlohmann::json{
        {"inputText", request.inputText},
        {"textGenerationConfig", request.textGenerationConfig}
    };
}

GenerationRequest GenerationRequest::fromPrompt(const std::string& prompt) {
    GenerationRequest request;
    request.inputText = prompt;
    request.textGenerationConfig.temperature = TitanCodec::TEMPERATURE;
    request.textGenerationConfig.topP = TitanCodec::TOP_P;
    request.textGenerationConfig.maxTokenCount = TitanCodec::MAX_TOKEN_COUNT;
    request.textGenerationConfig.stopSequences = {TitanCodec::STOP_SEQUENCE};
    return request;
}

std::string TitanCodec::encode(const std::string& prompt) {
    try {
        nlohmann::json body = GenerationRequest::fromPrompt(prompt);
        // 非法UTF-8在dump时抛出type_error
        return body.dump();
    } catch (const nlohmann::json::exception& e) {
        throw CodecException(CodecError::ENCODING_FAILED,
                             std::string("failed to serialize request: ") + e.what());
    }
}

GenerationResult TitanCodec::decode(const std::string& bytes) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw CodecException(CodecError::DECODING_FAILED,
                             std::string("response is not valid JSON: ") + e.what());
    }
    
    if (!body.is_object()) {
        throw CodecException(CodecError::DECODING_FAILED, "response must be a JSON object");
    }
    
    GenerationResult result;
    result.inputTextTokenCount = requireInt(body, "inputTextTokenCount", "response");
    
    const nlohmann::json& results = requireField(body, "results", "response");
    if (!results.is_array()) {
        throw CodecException(CodecError::DECODING_FAILED, "field 'results' in response must be an array");
    }
    
    result.results.reserve(results.size());
    for (const auto& item : results) {
        if (!item.is_object()) {
            throw CodecException(CodecError::DECODING_FAILED, "entries of 'results' must be objects");
        }
        TitanTextResult text;
        text.tokenCount = requireInt(item, "tokenCount", "result");
        text.outputText = requireString(item, "outputText", "result");
        text.completionReason = requireString(item, "completionReason", "result");
        result.results.push_back(std::move(text));
    }
    
    return result;
}

std::string TitanCodec::firstText(const GenerationResult& result) {
    if (result.results.empty()) {
        throw CodecException(CodecError::EMPTY_RESULT, "response contains no results");
    }
    return result.results.front().outputText;
}

}  // namespace crelay
