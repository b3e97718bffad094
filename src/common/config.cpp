#include "crelay/common/config.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"

namespace crelay {

void Config::load(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        config_ = YAML::LoadFile(configPath);
        CRELAY_INFO("Configuration loaded from: %s", configPath.c_str());
    } catch (const YAML::Exception& e) {
        CRELAY_ERROR("Failed to load config file: %s. Error: %s", 
                  configPath.c_str(), e.what());
        throw ConfigException("Config load failed: " + configPath);
    }
}

template <typename T>
T Config::get(const char* section, const char* key, const T& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.IsMap()) {
        return fallback;
    }
    const YAML::Node sectionNode = config_[section];
    if (!sectionNode || !sectionNode.IsMap()) {
        return fallback;
    }
    const YAML::Node value = sectionNode[key];
    if (!value) {
        return fallback;
    }
    return value.as<T>(fallback);
}

// 服务器配置
std::string Config::serverHost() const {
    return get<std::string>("server", "host", "0.0.0.0");
}

int Config::serverPort() const {
    return get<int>("server", "port", 8000);
}

int Config::serverNumThreads() const {
    return get<int>("server", "num_threads", 0);
}

int Config::serverMinThreads() const {
    return get<int>("server", "min_threads", 2);
}

std::string Config::serverGreeting() const {
    return get<std::string>("server", "greeting", "Hello, world!");
}

// Bedrock推理服务配置
std::string Config::bedrockRegion() const {
    return get<std::string>("bedrock", "region", "eu-west-1");
}

std::string Config::bedrockModelId() const {
    return get<std::string>("bedrock", "model_id", "amazon.titan-text-lite-v1:0:4k");
}

int Config::bedrockConnectTimeoutMs() const {
    return get<int>("bedrock", "connect_timeout_ms", 5000);
}

int Config::bedrockRequestTimeoutMs() const {
    return get<int>("bedrock", "request_timeout_ms", 120000);
}

// 流式配置
bool Config::streamingSkipControlFrames() const {
    return get<bool>("streaming", "skip_control_frames", false);
}

// 日志配置
std::string Config::loggingLevel() const {
    return get<std::string>("logging", "level", "info");
}

std::string Config::loggingFile() const {
    return get<std::string>("logging", "file", "");
}

} // namespace crelay
