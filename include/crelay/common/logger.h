#pragma once
#include <memory>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace crelay {

class Logger {
public:
    static Logger& instance();
    
    // printf风格的格式化支持
    void trace(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::trace, fmt, args);
        va_end(args);
    }
    
    void debug(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::debug, fmt, args);
        va_end(args);
    }
    
    void info(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::info, fmt, args);
        va_end(args);
    }
    
    void warn(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::warn, fmt, args);
        va_end(args);
    }
    
    void error(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::err, fmt, args);
        va_end(args);
    }
    
    void critical(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logWithPrintfStyle(spdlog::level::critical, fmt, args);
        va_end(args);
    }
    
    void setLevel(spdlog::level::level_enum level);
    
    /**
     * @brief 按名称设置日志级别
     * @param levelName trace/debug/info/warn/error
     * @return 名称无法识别时返回false，级别保持不变
     */
    bool setLevel(const std::string& levelName);
    
    void addFileSink(const std::string& filename);
    void flush();
    bool shouldLog(spdlog::level::level_enum level) const;

private:
    Logger();
    void logWithPrintfStyle(spdlog::level::level_enum level, const char* fmt, va_list args);
    std::shared_ptr<spdlog::logger> logger_;
};

// 全局日志宏
#define CRELAY_TRACE(...)    crelay::Logger::instance().trace(__VA_ARGS__)
#define CRELAY_DEBUG(...)    crelay::Logger::instance().debug(__VA_ARGS__)
#define CRELAY_INFO(...)     crelay::Logger::instance().info(__VA_ARGS__)
#define CRELAY_WARN(...)     crelay::Logger::instance().warn(__VA_ARGS__)
#define CRELAY_ERROR(...)    crelay::Logger::instance().error(__VA_ARGS__)
#define CRELAY_CRITICAL(...) crelay::Logger::instance().critical(__VA_ARGS__)

} // namespace crelay
