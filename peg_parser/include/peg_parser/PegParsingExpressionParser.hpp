#pragma once
#include "peg_parser/PegParsingExpression.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace peg {

// Parses one pattern in PEG notation. Throws GrammarError on malformed input.
sp<ParsingExpression> stringToParsingExpression(std::string_view expr);

class ExpressionTokenizer {
public:
    explicit ExpressionTokenizer(std::string_view expr);
    [[nodiscard]] inline const std::optional<std::string>& currentToken() const {
        return mCurrentToken;
    }
    void advance();
    [[nodiscard]] size_t getOffset() const {
        return mTokenStart;
    }

private:
    void genNextToken();
    void consumeNonTerminal();
    std::string consumeString(char start, char end);
    void consumeLabel();
    char getCurrentChar();
    char getNextChar();
    bool skipWhitespaces();

    size_t mOffset = 0;
    size_t mTokenStart = 0;
    const std::string_view mExprString;
    std::optional<std::string> mCurrentToken;
};

}
