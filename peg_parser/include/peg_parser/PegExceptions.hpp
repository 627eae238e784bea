#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace peg {

class ParseException : public std::exception {
public:
    explicit ParseException(std::string msg)
    : mMsg(std::move(msg)) {
    }
    [[nodiscard]] const char* what() const noexcept override {
        return mMsg.c_str();
    }

private:
    std::string mMsg;
};

class SyntaxError : public ParseException {
public:
    SyntaxError(std::string msg, size_t offset, size_t line, size_t column, std::string ruleName, std::string snippet)
    : ParseException(std::move(msg)), mOffset(offset), mLine(line), mColumn(column), mRuleName(std::move(ruleName)), mSnippet(std::move(snippet)) {
    }
    [[nodiscard]] size_t getOffset() const {
        return mOffset;
    }
    [[nodiscard]] size_t getLine() const {
        return mLine;
    }
    [[nodiscard]] size_t getColumn() const {
        return mColumn;
    }
    // Empty for trailing-input errors.
    [[nodiscard]] const std::string& getRuleName() const {
        return mRuleName;
    }
    [[nodiscard]] const std::string& getSnippet() const {
        return mSnippet;
    }

private:
    size_t mOffset, mLine, mColumn;
    std::string mRuleName, mSnippet;
};

class ResourceExhaustedError : public ParseException {
public:
    ResourceExhaustedError(std::string msg, size_t depth)
    : ParseException(std::move(msg)), mDepth(depth) {
    }
    [[nodiscard]] size_t getDepth() const {
        return mDepth;
    }

private:
    size_t mDepth;
};

class GrammarError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
