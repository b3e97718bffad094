#include "crelay/common/logger.h"
#include <memory>
#include <vector>

namespace crelay {

Logger::Logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    
    logger_ = std::make_shared<spdlog::logger>("crelay", console_sink);
    logger_->set_level(spdlog::level::info);
    spdlog::register_logger(logger_);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::logWithPrintfStyle(spdlog::level::level_enum level, const char* fmt, va_list args) {
    if (!logger_->should_log(level)) {
        return;
    }
    
    // 首先计算需要的缓冲区大小
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);
    
    if (size < 0) {
        logger_->log(level, "log format error: {}", fmt);
        return;
    }
    
    std::vector<char> buffer(size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    
    logger_->log(level, "{}", buffer.data());
}

void Logger::setLevel(spdlog::level::level_enum level) {
    logger_->set_level(level);
}

bool Logger::setLevel(const std::string& levelName) {
    if (levelName == "trace") {
        setLevel(spdlog::level::trace);
    } else if (levelName == "debug") {
        setLevel(spdlog::level::debug);
    } else if (levelName == "info") {
        setLevel(spdlog::level::info);
    } else if (levelName == "warn") {
        setLevel(spdlog::level::warn);
    } else if (levelName == "error") {
        setLevel(spdlog::level::err);
    } else {
        return false;
    }
    return true;
}

void Logger::addFileSink(const std::string& filename) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger_->sinks().push_back(file_sink);
}

void Logger::flush() {
    logger_->flush();
}

bool Logger::shouldLog(spdlog::level::level_enum level) const {
    return logger_ && logger_->should_log(level);
}

} // namespace crelay
