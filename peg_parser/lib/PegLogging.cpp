#include "peg_parser/PegLogging.hpp"
#include <cstring>

namespace peg {

std::ostream& operator<<(std::ostream& os, LogLevel level) {
    switch(level) {
    case LogLevel::DEBUG:
        os << "[DEBUG]";
        break;
    case LogLevel::INFO:
        os << "[INFO ]";
        break;
    case LogLevel::WARN:
        os << "[WARN ]";
        break;
    case LogLevel::ERROR:
        os << "[ERROR]";
        break;
    }
    return os;
}

Logger& Logger::get() {
    static Logger logger;
    return logger;
}

void Logger::write(LogLevel level, const char* file, int line, const std::string& message) {
    const char* fileName = strrchr(file, '/');
    fileName = fileName ? fileName + 1 : file;
    *mOutput << level << " " << fileName << ":" << line << ": " << message << "\n";
}

}
