/**
 * @file titan_codec.h
 * @brief Titan文本模型请求/响应编解码器
 * @author cRelay Team
 * @date 2026-10-12
 */

#ifndef CRELAY_CODEC_TITAN_CODEC_H
#define CRELAY_CODEC_TITAN_CODEC_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crelay {

/**
 * @brief 文本生成参数
 *
 * 所有请求使用同一组固定参数，不接受请求级覆盖。
 */
struct TextGenerationConfig {
    float temperature;                        ///< 温度参数
    float topP;                               ///< Top-P采样参数
    int maxTokenCount;                        ///< 最大生成token数
    std::vector<std::string> stopSequences;   ///< 停止序列
};

/**
 * @brief 发往上游的生成请求
 */
struct GenerationRequest {
    std::string inputText;                    ///< 用户提示词
    TextGenerationConfig textGenerationConfig;

    /**
     * @brief 由提示词和固定生成参数构造请求
     * @param prompt 用户提示词
     * @return 生成请求
     */
    static GenerationRequest fromPrompt(const std::string& prompt);
};

/**
 * @brief 单个候选结果
 */
struct TitanTextResult {
    int tokenCount = 0;           ///< 生成token数
    std::string outputText;       ///< 生成文本
    std::string completionReason; ///< 结束原因
};

/**
 * @brief 上游响应（完整响应或流式响应中的一个分片）
 */
struct GenerationResult {
    int inputTextTokenCount = 0;
    std::vector<TitanTextResult> results;
};

void to_json(nlohmann::json& j, const TextGenerationConfig& config);
void to_json(nlohmann::json& j, const GenerationRequest& request);

/**
 * @brief Titan请求编解码器
 *
 * 非流式与流式两条路径共用。
 */
class TitanCodec {
public:
    static constexpr float TEMPERATURE = 0.0f;
    static constexpr float TOP_P = 0.0f;
    static constexpr int MAX_TOKEN_COUNT = 100;
    static constexpr const char* STOP_SEQUENCE = "|";

    /**
     * @brief 将提示词编码为上游请求体
     * @param prompt 用户提示词
     * @return JSON请求体
     * @throws CodecException(ENCODING_FAILED) 序列化失败（如提示词不是合法UTF-8）
     */
    static std::string encode(const std::string& prompt);

    /**
     * @brief 解析上游响应体
     * @param bytes 响应体
     * @return 解析后的响应
     * @throws CodecException(DECODING_FAILED) 不是JSON，或字段缺失、类型错误
     */
    static GenerationResult decode(const std::string& bytes);

    /**
     * @brief 获取第一个候选的生成文本
     * @param result 上游响应
     * @return 生成文本
     * @throws CodecException(EMPTY_RESULT) 候选列表为空
     */
    static std::string firstText(const GenerationResult& result);
};

}  // namespace crelay

#endif
