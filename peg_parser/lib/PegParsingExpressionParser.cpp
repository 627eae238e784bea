#include "peg_parser/PegParsingExpressionParser.hpp"
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegUtil.hpp"

namespace peg {

static sp<ParsingExpression> parseChoice(ExpressionTokenizer& tok);

static std::string unescapeLiteral(std::string_view body) {
    std::string ret;
    for(size_t i = 0; i < body.size(); ++i) {
        if(body[i] != '\\' || i + 1 >= body.size()) {
            ret += body[i];
            continue;
        }
        ++i;
        switch(body[i]) {
        case 'n':
            ret += '\n';
            break;
        case 't':
            ret += '\t';
            break;
        case 'r':
            ret += '\r';
            break;
        case '\\':
        case '\'':
        case '"':
            ret += body[i];
            break;
        default:
            ret += '\\';
            ret += body[i];
        }
    }
    return ret;
}

static bool isTokenStart(const std::optional<std::string>& token, char c) {
    return token && !token->empty() && token->front() == c;
}

static sp<ParsingExpression> parseAtom(ExpressionTokenizer& tok) {
    if(!tok.currentToken())
        return nullptr;
    const auto& token = *tok.currentToken();
    if(token.front() == '\'' || token.front() == '"') {
        auto expr = std::make_shared<TerminalParsingExpression>(unescapeLiteral(std::string_view{ token }.substr(1, token.size() - 2)));
        tok.advance();
        return expr;
    } else if(token == "(") {
        tok.advance();
        auto expr = parseChoice(tok);
        if(!tok.currentToken()) {
            throw GrammarError{ "Missing closing bracket" };
        }
        if(*tok.currentToken() != ")") {
            throw GrammarError{ "Expected closing bracket, not '" + *tok.currentToken() + "'" };
        }
        tok.advance();
        return expr;
    } else if(token == ".") {
        tok.advance();
        return std::make_shared<AnyCharParsingExpression>();
    } else if(isalpha(static_cast<unsigned char>(token.front())) || token.front() == '_') {
        auto tokenKind = tokenKindFromString(token);
        sp<ParsingExpression> expr;
        if(tokenKind) {
            expr = std::make_shared<TokenParsingExpression>(*tokenKind);
        } else {
            expr = std::make_shared<NonTerminalParsingExpression>(token);
        }
        tok.advance();
        return expr;
    } else if(token.front() == '[') {
        auto expr = std::make_shared<CharClassParsingExpression>(token.substr(1, token.size() - 2));
        tok.advance();
        return expr;
    }
    return nullptr;
}

static sp<ParsingExpression> parseSuffix(ExpressionTokenizer& tok) {
    auto atom = parseAtom(tok);
    if(!atom || !tok.currentToken()) {
        return atom;
    }
    if(*tok.currentToken() == "?") {
        tok.advance();
        return std::make_shared<OptionalParsingExpression>(std::move(atom));
    } else if(*tok.currentToken() == "*") {
        tok.advance();
        return std::make_shared<ZeroOrMoreParsingExpression>(std::move(atom));
    } else if(*tok.currentToken() == "+") {
        tok.advance();
        return std::make_shared<OneOrMoreParsingExpression>(std::move(atom));
    }
    return atom;
}

static sp<ParsingExpression> requireOperand(sp<ParsingExpression> expr, const char* op) {
    if(!expr) {
        throw GrammarError{ std::string{ "Expected an expression after '" } + op + "'" };
    }
    return expr;
}

static sp<ParsingExpression> parsePrefix(ExpressionTokenizer& tok) {
    if(!tok.currentToken()) {
        return nullptr;
    }
    if(*tok.currentToken() == "!") {
        tok.advance();
        return std::make_shared<NotParsingExpression>(requireOperand(parseSuffix(tok), "!"));
    }
    if(*tok.currentToken() == "&") {
        tok.advance();
        return std::make_shared<AndParsingExpression>(requireOperand(parseSuffix(tok), "&"));
    }
    if(isTokenStart(tok.currentToken(), '@')) {
        // "@name:"
        auto label = tok.currentToken()->substr(1, tok.currentToken()->size() - 2);
        tok.advance();
        auto expr = requireOperand(parsePrefix(tok), "@");
        expr->setLabel(std::move(label));
        return expr;
    }
    return parseSuffix(tok);
}

static sp<ParsingExpression> parseSequence(ExpressionTokenizer& tok) {
    std::vector<sp<ParsingExpression>> children;
    while(tok.currentToken() && *tok.currentToken() != "/" && *tok.currentToken() != ")") {
        auto expr = parsePrefix(tok);
        if(!expr) {
            throw GrammarError{ "Unexpected '" + *tok.currentToken() + "'" };
        }
        children.emplace_back(std::move(expr));
    }
    if(children.empty()) {
        return std::make_shared<TerminalParsingExpression>("");
    }
    if(children.size() == 1) {
        return std::move(children.at(0));
    }
    return std::make_shared<SequenceParsingExpression>(std::move(children));
}

static sp<ParsingExpression> parseChoice(ExpressionTokenizer& tok) {
    auto left = parseSequence(tok);
    std::vector<sp<ParsingExpression>> children;
    children.emplace_back(std::move(left));
    while(tok.currentToken() && *tok.currentToken() == "/") {
        tok.advance();
        children.emplace_back(parseSequence(tok));
    }
    if(children.size() == 1) {
        return std::move(children.at(0));
    }
    return std::make_shared<ChoiceParsingExpression>(std::move(children));
}

sp<ParsingExpression> stringToParsingExpression(std::string_view expr) {
    ExpressionTokenizer tok{ expr };
    auto ret = parseChoice(tok);
    if(tok.currentToken()) {
        throw GrammarError{ "Unexpected '" + *tok.currentToken() + "' at offset " + std::to_string(tok.getOffset()) };
    }
    return ret;
}

ExpressionTokenizer::ExpressionTokenizer(std::string_view expr)
: mExprString(expr) {
    genNextToken();
}

void ExpressionTokenizer::advance() {
    genNextToken();
}

void ExpressionTokenizer::genNextToken() {
    skipWhitespaces();
    auto start = mOffset;
    mTokenStart = start;
    if(mOffset < mExprString.size()) {
        switch(getCurrentChar()) {
        case '\'':
            mCurrentToken = consumeString('\'', '\'');
            break;
        case '"':
            mCurrentToken = consumeString('"', '"');
            break;
        case '[':
            mCurrentToken = consumeString('[', ']');
            break;
        case '@':
            consumeLabel();
            mCurrentToken = mExprString.substr(start, mOffset - start);
            break;
        case '+':
        case '*':
        case ')':
        case '(':
        case '/':
        case '?':
        case '!':
        case '&':
        case '.':
            mOffset += 1;
            mCurrentToken = mExprString.substr(start, mOffset - start);
            break;
        default:
            if(isWordChar(getCurrentChar())) {
                consumeNonTerminal();
                mCurrentToken = mExprString.substr(start, mOffset - start);
            } else {
                throw GrammarError{ std::string{ "Invalid input char: '" } + getCurrentChar() + "'" };
            }
        }
    } else {
        mCurrentToken = {};
    }
}

void ExpressionTokenizer::consumeNonTerminal() {
    while(mOffset < mExprString.size() && isWordChar(getCurrentChar())) {
        mOffset += 1;
    }
}

void ExpressionTokenizer::consumeLabel() {
    mOffset += 1;
    auto nameStart = mOffset;
    consumeNonTerminal();
    if(mOffset == nameStart || mOffset >= mExprString.size() || getCurrentChar() != ':') {
        throw GrammarError{ "Malformed capture label, expected '@name:'" };
    }
    mOffset += 1;
}

std::string ExpressionTokenizer::consumeString(const char start, const char end) {
    std::string ret;
    ret += getCurrentChar();
    mOffset += 1;
    while(true) {
        if(mOffset >= mExprString.size()) {
            throw GrammarError{ start == '[' ? "Unterminated character class in expression" : "Unterminated string in expression" };
        }
        if(getCurrentChar() == '\\' && mOffset + 1 < mExprString.size()) {
            // keep the escape, it is resolved later
            ret += getCurrentChar();
            ret += getNextChar();
            mOffset += 2;
            continue;
        }
        if(getCurrentChar() == end) {
            ret += getCurrentChar();
            mOffset += 1;
            return ret;
        }
        ret += getCurrentChar();
        mOffset += 1;
    }
}

char ExpressionTokenizer::getCurrentChar() {
    return mExprString.at(mOffset);
}
char ExpressionTokenizer::getNextChar() {
    if(mExprString.size() <= mOffset + 1) {
        return -1;
    }
    return mExprString.at(mOffset + 1);
}

bool ExpressionTokenizer::skipWhitespaces() {
    const static std::string WHITESPACE_CHARS{ "\t \n\r" };
    bool didSkip = false;
    while(mExprString.size() > mOffset && WHITESPACE_CHARS.find(mExprString.at(mOffset)) != std::string::npos) {
        didSkip = true;
        mOffset += 1;
    }
    return didSkip;
}

}
