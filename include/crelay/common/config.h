#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <mutex>

namespace crelay {

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * @brief 加载YAML配置文件，替换当前配置
     * @throws ConfigException 文件不存在或解析失败
     */
    void load(const std::string& configPath);
    
    // 服务器配置
    std::string serverHost() const;
    int serverPort() const;
    int serverNumThreads() const;
    int serverMinThreads() const;
    std::string serverGreeting() const;
    
    // Bedrock推理服务配置
    std::string bedrockRegion() const;
    std::string bedrockModelId() const;
    int bedrockConnectTimeoutMs() const;
    int bedrockRequestTimeoutMs() const;
    
    // 流式配置
    bool streamingSkipControlFrames() const;
    
    // 日志配置
    std::string loggingLevel() const;
    std::string loggingFile() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template <typename T>
    T get(const char* section, const char* key, const T& fallback) const;

    YAML::Node config_;
    mutable std::mutex mutex_;
};

} // namespace crelay
