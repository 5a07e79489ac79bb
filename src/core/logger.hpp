#pragma once
#include <cstdio>
#include <string>
#include <utility>

namespace slc {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

struct LogConfig {
    LogLevel level{LogLevel::INFO};
    std::FILE* destination{stderr};
};

// Lines are written as "LEVEL[name] message".
class Logger {
   public:
    Logger(std::string name, const LogConfig& cfg) : name_(std::move(name)), cfg_(cfg) {}

    bool enabled(LogLevel lvl) const {
        return lvl >= cfg_.level;
    }
    void log(LogLevel lvl, const std::string& msg) const {
        if (!enabled(lvl) || cfg_.destination == nullptr) return;
        std::fprintf(cfg_.destination, "%s[%s] %s\n", level_name(lvl), name_.c_str(), msg.c_str());
        std::fflush(cfg_.destination);
    }
    void debug(const std::string& msg) const { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) const { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg) const { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) const { log(LogLevel::ERROR, msg); }

    const std::string& name() const {
        return name_;
    }

   private:
    std::string name_;
    LogConfig cfg_;
};
}  // namespace slc
