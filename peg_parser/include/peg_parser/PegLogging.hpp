#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace peg {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

std::ostream& operator<<(std::ostream& os, LogLevel level);

class Logger final {
public:
    static Logger& get();

    void setFilter(LogLevel level) {
        mFilter = level;
    }
    [[nodiscard]] LogLevel getFilter() const {
        return mFilter;
    }
    void setOutput(std::ostream& output) {
        mOutput = &output;
    }
    [[nodiscard]] bool isEnabled(LogLevel level) const {
        return level >= mFilter;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, Args&&... args) {
        if(!isEnabled(level))
            return;
        std::stringstream message;
        (message << ... << std::forward<Args>(args));
        write(level, file, line, message.str());
    }

private:
    Logger() = default;
    void write(LogLevel level, const char* file, int line, const std::string& message);

    LogLevel mFilter = LogLevel::WARN;
    std::ostream* mOutput = &std::cerr;
};

}

#define PEG_LOG(level, ...) ::peg::Logger::get().log(level, __FILE__, __LINE__, __VA_ARGS__)
#define PEG_LOG_DEBUG(...) PEG_LOG(::peg::LogLevel::DEBUG, __VA_ARGS__)
#define PEG_LOG_INFO(...) PEG_LOG(::peg::LogLevel::INFO, __VA_ARGS__)
#define PEG_LOG_WARN(...) PEG_LOG(::peg::LogLevel::WARN, __VA_ARGS__)
#define PEG_LOG_ERROR(...) PEG_LOG(::peg::LogLevel::ERROR, __VA_ARGS__)
