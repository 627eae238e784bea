#pragma once
#include <functional>
#include <stdexcept>
#include <string>

namespace parsercraft {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DestructorWrapper {
public:
    explicit inline DestructorWrapper(std::function<void()> callback)
    : mCallback(std::move(callback)) {
    }
    inline ~DestructorWrapper() {
        if(mCallback)
            mCallback();
    }
    DestructorWrapper(const DestructorWrapper&) = delete;
    DestructorWrapper& operator=(const DestructorWrapper&) = delete;

private:
    std::function<void()> mCallback;
};

// Throws std::runtime_error if the file can't be read.
std::string readFile(const std::string& path);

}
