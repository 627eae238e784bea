#include "peg_parser/PegParsingExpression.hpp"
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegInterpreter.hpp"
#include "peg_parser/PegTokenizer.hpp"
#include <algorithm>

namespace peg {

static const std::vector<sp<ParsingExpression>> gNoChildren;

static std::string escapeLiteral(const std::string& value) {
    std::string ret;
    for(char c : value) {
        switch(c) {
        case '\\':
            ret += "\\\\";
            break;
        case '\'':
            ret += "\\'";
            break;
        case '\n':
            ret += "\\n";
            break;
        case '\t':
            ret += "\\t";
            break;
        case '\r':
            ret += "\\r";
            break;
        default:
            ret += c;
        }
    }
    return ret;
}

const char* expressionKindToString(ExpressionKind kind) {
    switch(kind) {
    case ExpressionKind::SEQUENCE:
        return "SEQUENCE";
    case ExpressionKind::CHOICE:
        return "CHOICE";
    case ExpressionKind::ZERO_OR_MORE:
        return "ZERO_OR_MORE";
    case ExpressionKind::ONE_OR_MORE:
        return "ONE_OR_MORE";
    case ExpressionKind::OPTIONAL:
        return "OPTIONAL";
    case ExpressionKind::AND_PREDICATE:
        return "AND_PREDICATE";
    case ExpressionKind::NOT_PREDICATE:
        return "NOT_PREDICATE";
    case ExpressionKind::LITERAL:
        return "LITERAL";
    case ExpressionKind::CHAR_CLASS:
        return "CHAR_CLASS";
    case ExpressionKind::ANY_CHAR:
        return "ANY_CHAR";
    case ExpressionKind::RULE_REF:
        return "RULE_REF";
    case ExpressionKind::TOKEN_REF:
        return "TOKEN_REF";
    }
    return "UNKNOWN";
}

const char* tokenKindToString(TokenKind kind) {
    switch(kind) {
    case TokenKind::NUMBER:
        return "NUMBER";
    case TokenKind::STRING:
        return "STRING";
    case TokenKind::IDENT:
        return "IDENT";
    case TokenKind::NEWLINE:
        return "NEWLINE";
    case TokenKind::END_OF_INPUT:
        return "EOF";
    case TokenKind::INDENT:
        return "INDENT";
    case TokenKind::DEDENT:
        return "DEDENT";
    }
    return "UNKNOWN";
}

std::optional<TokenKind> tokenKindFromString(std::string_view name) {
    static constexpr TokenKind ALL_KINDS[] = {
        TokenKind::NUMBER,
        TokenKind::STRING,
        TokenKind::IDENT,
        TokenKind::NEWLINE,
        TokenKind::END_OF_INPUT,
        TokenKind::INDENT,
        TokenKind::DEDENT,
    };
    for(auto kind : ALL_KINDS) {
        if(name == tokenKindToString(kind))
            return kind;
    }
    return {};
}

bool isImplementedToken(TokenKind kind) {
    return kind != TokenKind::INDENT && kind != TokenKind::DEDENT;
}

const std::vector<sp<ParsingExpression>>& ParsingExpression::getChildren() const {
    return gNoChildren;
}
std::string ParsingExpression::dumpLabel() const {
    if(!mLabel)
        return "";
    return "@" + *mLabel + ":";
}

TerminalParsingExpression::TerminalParsingExpression(std::string value)
: mValue(std::move(value)) {
    mWordBoundary = !mValue.empty() && std::all_of(mValue.cbegin(), mValue.cend(), [](char c) {
        return isalpha(static_cast<unsigned char>(c));
    });
}
MatchResult TerminalParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto start = interpreter.skipIgnored(state);
    auto tokenizerRet = interpreter.getTokenizer().matchString(start, mValue, mWordBoundary, interpreter.getCurrentReads());
    if(!tokenizerRet) {
        return MatchResult::failure(state);
    }
    return MatchResult::value(*tokenizerRet, MatchFragment{ .text = mValue, .offset = start.offset });
}
std::string TerminalParsingExpression::dump() const {
    return dumpLabel() + '\'' + escapeLiteral(mValue) + '\'';
}

CharClassParsingExpression::CharClassParsingExpression(std::string pattern)
: mPattern(std::move(pattern)) {
    try {
        mRegex = std::regex{ "[" + mPattern + "]" };
    } catch(const std::regex_error& e) {
        throw GrammarError{ "Invalid character class [" + mPattern + "]: " + e.what() };
    }
}
MatchResult CharClassParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto& tokenizer = interpreter.getTokenizer();
    auto tokenizerRet = tokenizer.matchCharClass(state, mRegex, interpreter.getCurrentReads());
    if(!tokenizerRet) {
        return MatchResult::failure(state);
    }
    return MatchResult::value(*tokenizerRet, MatchFragment{ .text = std::string{ tokenizer.getSlice(state.offset, tokenizerRet->offset) }, .offset = state.offset });
}
std::string CharClassParsingExpression::dump() const {
    return dumpLabel() + "[" + mPattern + "]";
}

MatchResult AnyCharParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto& tokenizer = interpreter.getTokenizer();
    auto tokenizerRet = tokenizer.matchAnyChar(state, interpreter.getCurrentReads());
    if(!tokenizerRet) {
        return MatchResult::failure(state);
    }
    return MatchResult::value(*tokenizerRet, MatchFragment{ .text = std::string{ tokenizer.getSlice(state.offset, tokenizerRet->offset) }, .offset = state.offset });
}
std::string AnyCharParsingExpression::dump() const {
    return dumpLabel() + ".";
}

NonTerminalParsingExpression::NonTerminalParsingExpression(std::string value)
: mNonTerminal(std::move(value)) {
}
MatchResult NonTerminalParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    return interpreter.matchRule(mNonTerminal, state);
}
std::string NonTerminalParsingExpression::dump() const {
    return dumpLabel() + mNonTerminal;
}

TokenParsingExpression::TokenParsingExpression(TokenKind kind)
: mKind(kind) {
}
MatchResult TokenParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    return interpreter.matchToken(mKind, state);
}
std::string TokenParsingExpression::dump() const {
    return dumpLabel() + tokenKindToString(mKind);
}

UnaryParsingExpression::UnaryParsingExpression(sp<ParsingExpression> child) {
    mChildren.emplace_back(std::move(child));
}
std::string UnaryParsingExpression::dumpChild(const char* prefix, const char* suffix) const {
    return dumpLabel() + prefix + "(" + getChild().dump() + ")" + suffix;
}

MatchResult OptionalParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto childRet = getChild().match(state, interpreter);
    if(childRet.success) {
        return childRet;
    }
    return MatchResult::empty(state);
}
std::string OptionalParsingExpression::dump() const {
    return dumpChild("", "?");
}

static MatchResult matchRepetition(const ParsingExpression& child, ParsingState state, PegInterpreter& interpreter, size_t minCount) {
    auto ret = MatchResult::empty(state);
    size_t count = 0;
    while(true) {
        auto childRet = child.match(ret.state, interpreter);
        // a match that does not advance would repeat forever
        if(!childRet.success || childRet.state == ret.state) {
            break;
        }
        ret.state = childRet.state;
        ret.append(std::move(childRet));
        count += 1;
    }
    if(count < minCount) {
        return MatchResult::failure(state);
    }
    return ret;
}

MatchResult OneOrMoreParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    return matchRepetition(getChild(), state, interpreter, 1);
}
std::string OneOrMoreParsingExpression::dump() const {
    return dumpChild("", "+");
}

MatchResult ZeroOrMoreParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    return matchRepetition(getChild(), state, interpreter, 0);
}
std::string ZeroOrMoreParsingExpression::dump() const {
    return dumpChild("", "*");
}

MatchResult AndParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto childRet = getChild().match(state, interpreter);
    if(!childRet.success) {
        return MatchResult::failure(state);
    }
    return MatchResult::empty(state);
}
std::string AndParsingExpression::dump() const {
    return dumpChild("&", "");
}

MatchResult NotParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto childRet = getChild().match(state, interpreter);
    if(childRet.success) {
        return MatchResult::failure(state);
    }
    return MatchResult::empty(state);
}
std::string NotParsingExpression::dump() const {
    return dumpChild("!", "");
}

SequenceParsingExpression::SequenceParsingExpression(std::vector<sp<ParsingExpression>> children)
: mChildren(std::move(children)) {
}
MatchResult SequenceParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    auto ret = MatchResult::empty(state);
    for(auto& child : mChildren) {
        auto childRet = child->match(ret.state, interpreter);
        if(!childRet.success) {
            return MatchResult::failure(state);
        }
        ret.state = childRet.state;
        ret.append(std::move(childRet));
    }
    return ret;
}
std::string SequenceParsingExpression::dump() const {
    std::string ret;
    for(auto it = mChildren.cbegin(); it != mChildren.cend(); it++) {
        ret += (*it)->dump();
        if(std::next(it) != mChildren.cend()) {
            ret += " ";
        }
    }
    if(getLabel()) {
        return dumpLabel() + "(" + ret + ")";
    }
    return ret;
}
void SequenceParsingExpression::collectLeadingRuleRefs(std::vector<std::string>& names) const {
    if(!mChildren.empty()) {
        mChildren.front()->collectLeadingRuleRefs(names);
    }
}

ChoiceParsingExpression::ChoiceParsingExpression(std::vector<sp<ParsingExpression>> children)
: mChildren(std::move(children)) {
}
MatchResult ChoiceParsingExpression::match(ParsingState state, PegInterpreter& interpreter) const {
    for(auto& child : mChildren) {
        auto childRet = child->match(state, interpreter);
        if(childRet.success) {
            return childRet;
        }
    }
    return MatchResult::failure(state);
}
std::string ChoiceParsingExpression::dump() const {
    std::string ret = dumpLabel() + "(";
    for(auto it = mChildren.cbegin(); it != mChildren.cend(); it++) {
        ret += (*it)->dump();
        if(std::next(it) != mChildren.cend()) {
            ret += " / ";
        }
    }
    ret += ')';
    return ret;
}
void ChoiceParsingExpression::collectLeadingRuleRefs(std::vector<std::string>& names) const {
    for(auto& child : mChildren) {
        child->collectLeadingRuleRefs(names);
    }
}

}
