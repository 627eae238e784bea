#pragma once

#include "peg_parser/PegLogging.hpp"
#include <cctype>
#include <chrono>
#include <cstring>
#include <memory>

namespace peg {

template<typename T>
using sp = std::shared_ptr<T>;

template<typename T>
using up = std::unique_ptr<T>;

template<typename T>
using wp = std::weak_ptr<T>;

class Stopwatch final {
public:
    explicit Stopwatch(const char* name = "") {
        mStart = std::chrono::steady_clock::now();
        mName = name;
    }
    [[nodiscard]] std::chrono::nanoseconds getElapsed() const {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - mStart);
    }
    void stop() {
        if(mStopped)
            return;
        if(strlen(mName) > 0) {
            PEG_LOG_DEBUG(mName, " took ", getElapsed().count() / 1000.0, "us");
        }
        mStopped = true;
    }
    ~Stopwatch() {
        stop();
    }

private:
    const char* mName;
    std::chrono::steady_clock::time_point mStart;
    bool mStopped = false;
};

// True for the characters that continue an identifier or keyword.
inline bool isWordChar(char c) {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}
