/**
 * @file main.cpp
 * @brief cRelay 服务器主入口
 * @author cRelay Team
 * @date 2026-10-16
 */

#include "crelay/http/http_server.h"

#include <signal.h>
#include <getopt.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "crelay/http/handler.h"
#include "crelay/http/prompt_endpoint.h"
#include "crelay/http/response_builder.h"
#include "crelay/client/bedrock_client.h"
#include "crelay/common/config.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"
#include "crelay/common/secrets.h"

// 信号处理只设置标志，由主线程负责停止服务器
static std::atomic<bool> g_shutdownRequested{false};

namespace ApiEndpoints {
    constexpr const char* ROOT = "/";
}

/**
 * @brief 信号处理函数
 * @param signal 信号编号
 */
void signalHandler(int signal) {
    (void)signal;
    g_shutdownRequested.store(true);
}

/**
 * @brief 打印使用说明
 * @param programName 程序名称
 */
void printUsage(const char* programName) {
    CRELAY_INFO("Usage: %s [options]", programName);
    CRELAY_INFO("");
    CRELAY_INFO("Options:");
    CRELAY_INFO("  --config PATH            Path to config file (default: config/config.yaml)");
    CRELAY_INFO("  --secrets PATH           Path to secrets file (default: config/secrets.yaml if present)");
    CRELAY_INFO("  --host HOST              Server host (default: 0.0.0.0)");
    CRELAY_INFO("  --port PORT              Server port (default: 8000)");
    CRELAY_INFO("  --log-level LEVEL        Log level: trace, debug, info, warn, error (default: info)");
    CRELAY_INFO("  --log-file PATH          Log file path (optional)");
    CRELAY_INFO("  --help                   Show this help message");
    CRELAY_INFO("");
    CRELAY_INFO("Secrets AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_URL are read from the");
    CRELAY_INFO("environment first, then from the secrets file.");
}

/**
 * @brief 打印服务器横幅
 */
void printBanner() {
    CRELAY_INFO("");
    CRELAY_INFO("            ____       _             ");
    CRELAY_INFO("   ___ _ __|  _ \\ ___| | __ _ _   _ ");
    CRELAY_INFO("  / __| '__| |_) / _ \\ |/ _` | | | |");
    CRELAY_INFO(" | (__| |  |  _ <  __/ | (_| | |_| |");
    CRELAY_INFO("  \\___|_|  |_| \\_\\___|_|\\__,_|\\__, |");
    CRELAY_INFO("                              |___/ ");
    CRELAY_INFO("");
}

/**
 * @brief 查找配置文件
 * @param explicitPath --config 指定的路径，可为空
 * @return 找到的路径，找不到时为空
 */
static std::string locateConfig(const std::string& explicitPath) {
    namespace fs = std::filesystem;
    
    if (!explicitPath.empty()) {
        return fs::exists(explicitPath) ? explicitPath : std::string();
    }
    
    const fs::path candidates[] = {
        fs::path("config") / "config.yaml",
        fs::path("../config") / "config.yaml",
        fs::path("../../config") / "config.yaml"
    };
    for (const auto& p : candidates) {
        if (fs::exists(p)) {
            return p.string();
        }
    }
    return "";
}

/**
 * @brief 主函数
 * @param argc 参数个数
 * @param argv 参数数组
 * @return 程序退出码
 */
int main(int argc, char* argv[]) {
    crelay::Logger::instance().setLevel(spdlog::level::info);
    
    // 先收集 CLI 覆盖项，Config 文件加载后再计算最终值
    std::optional<std::string> hostOpt;
    std::optional<int> portOpt;
    std::optional<std::string> logLevelOpt;
    std::optional<std::string> logFileOpt;
    std::string configPath;
    std::string secretsPath;
    
    static struct option long_options[] = {
        {"config", required_argument, 0, 'f'},
        {"secrets", required_argument, 0, 's'},
        {"host", required_argument, 0, 'h'},
        {"port", required_argument, 0, 'p'},
        {"log-level", required_argument, 0, 'L'},
        {"log-file", required_argument, 0, 'F'},
        {"help", no_argument, 0, '?'},
        {0, 0, 0, 0}
    };
    
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "f:s:h:p:L:F:?", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'f':
                configPath = optarg;
                break;
            case 's':
                secretsPath = optarg;
                break;
            case 'h':
                hostOpt = optarg;
                break;
            case 'p':
                portOpt = std::atoi(optarg);
                break;
            case 'L':
                logLevelOpt = optarg;
                break;
            case 'F':
                logFileOpt = optarg;
                break;
            case '?':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 1;
        }
    }
    
    printBanner();
    
    try {
        std::string selectedConfigPath = locateConfig(configPath);
        if (selectedConfigPath.empty()) {
            throw crelay::ConfigException("Config file not found. Please pass --config or ensure config/config.yaml exists.");
        }
        CRELAY_INFO("Loading config from: %s", selectedConfigPath.c_str());
        crelay::Config::instance().load(selectedConfigPath);
        
        const crelay::Config& config = crelay::Config::instance();
        std::string host = hostOpt.value_or(config.serverHost());
        int port = portOpt.value_or(config.serverPort());
        std::string logLevel = logLevelOpt.value_or(config.loggingLevel());
        std::string logFile = logFileOpt.value_or(config.loggingFile());
        
        if (!crelay::Logger::instance().setLevel(logLevel)) {
            CRELAY_WARN("Unknown log level '%s', keeping info", logLevel.c_str());
        }
        if (!logFile.empty()) {
            crelay::Logger::instance().addFileSink(logFile);
            CRELAY_INFO("Logging to file: %s", logFile.c_str());
        }
        
        if (port <= 0 || port > 65535) {
            CRELAY_ERROR("Invalid port: %d", port);
            return 1;
        }
        
        // 密钥：环境变量优先，其次是密钥文件
        crelay::SecretStore secrets;
        if (secretsPath.empty() && std::filesystem::exists("config/secrets.yaml")) {
            secretsPath = "config/secrets.yaml";
        }
        crelay::Credentials credentials;
        try {
            secrets.loadFile(secretsPath);
            credentials = secrets.requireCredentials();
        } catch (const crelay::ConfigException& e) {
            CRELAY_CRITICAL("%s", e.what());
            crelay::Logger::instance().flush();
            return 1;
        }
        
        CRELAY_INFO("========================================");
        CRELAY_INFO("cRelay - Inference Relay Server");
        CRELAY_INFO("========================================");
        CRELAY_INFO("Configuration:");
        CRELAY_INFO("  - Host: %s", host.c_str());
        CRELAY_INFO("  - Port: %d", port);
        CRELAY_INFO("  - Region: %s", config.bedrockRegion().c_str());
        CRELAY_INFO("  - Model: %s", config.bedrockModelId().c_str());
        CRELAY_INFO("  - Skip control frames: %s", config.streamingSkipControlFrames() ? "true" : "false");
        CRELAY_INFO("  - Log Level: %s", logLevel.c_str());
        
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);
        // 流式客户端断开时只让send失败
        signal(SIGPIPE, SIG_IGN);
        
        crelay::BedrockClientOptions options;
        options.credentials = credentials;
        options.region = config.bedrockRegion();
        options.connectTimeoutMs = config.bedrockConnectTimeoutMs();
        options.requestTimeoutMs = config.bedrockRequestTimeoutMs();
        auto client = std::make_shared<const crelay::BedrockClient>(options);
        
        CRELAY_INFO("Setting up HTTP endpoints...");
        auto httpHandler = std::make_unique<crelay::HttpHandler>();
        
        const std::string greeting = config.serverGreeting();
        httpHandler->get(ApiEndpoints::ROOT, [greeting](const crelay::HttpRequest&) {
            return crelay::ResponseBuilder::text(greeting);
        });
        CRELAY_INFO("  - GET  %s", ApiEndpoints::ROOT);
        
        auto promptEndpoint = std::make_unique<crelay::PromptEndpoint>(client, config.bedrockModelId());
        promptEndpoint->registerTo(*httpHandler);
        
        auto streamedEndpoint = std::make_unique<crelay::StreamedPromptEndpoint>(
            client, config.bedrockModelId(), config.streamingSkipControlFrames());
        streamedEndpoint->registerTo(*httpHandler);
        
        crelay::HttpServer::init(host, port, httpHandler.get());
        if (!crelay::HttpServer::start()) {
            CRELAY_ERROR("Failed to start HTTP server on %s:%d", host.c_str(), port);
            crelay::Logger::instance().flush();
            return 1;
        }
        
        CRELAY_INFO("========================================");
        CRELAY_INFO("cRelay is ready, listening on http://%s:%d", host.c_str(), port);
        CRELAY_INFO("Press Ctrl+C to stop the server");
        CRELAY_INFO("========================================");
        
        while (crelay::HttpServer::isRunning() && !g_shutdownRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        
        CRELAY_INFO("Shutting down gracefully...");
        crelay::HttpServer::stop();
        
        // 端点需要活到所有worker线程退出
        streamedEndpoint.reset();
        promptEndpoint.reset();
    } catch (const std::exception& e) {
        CRELAY_ERROR("Failed to start server: %s", e.what());
        crelay::Logger::instance().flush();
        return 1;
    }
    
    CRELAY_INFO("Shutdown complete");
    crelay::Logger::instance().flush();
    return 0;
}
