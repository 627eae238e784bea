#include "peg_parser/PegTokenizer.hpp"
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegUtil.hpp"
#include <algorithm>

namespace peg {

static bool isRegexMetaChar(char c) {
    static const std::string META_CHARS{ ".*+?()[]{}|^$\\" };
    return META_CHARS.find(c) != std::string::npos;
}

// Returns the literal text every match starts with and the pattern index where it ends.
static std::pair<std::string, size_t> computeLiteralPrefix(const std::string& pattern) {
    // an alternation means a match can start in more than one way
    for(size_t i = 0; i < pattern.size(); ++i) {
        if(pattern[i] == '\\') {
            ++i;
        } else if(pattern[i] == '|') {
            return { "", 0 };
        }
    }
    std::string prefix;
    size_t i = 0;
    while(i < pattern.size()) {
        char c = pattern[i];
        size_t next = i + 1;
        if(c == '\\') {
            if(next >= pattern.size() || !isRegexMetaChar(pattern[next]) || pattern[next] == '|')
                break;
            c = pattern[next];
            next += 1;
        } else if(isRegexMetaChar(c)) {
            break;
        }
        if(next < pattern.size()) {
            auto quantifier = pattern[next];
            if(quantifier == '*' || quantifier == '?' || quantifier == '{')
                break;
            if(quantifier == '+') {
                prefix += c;
                break;
            }
        }
        prefix += c;
        i = next;
    }
    return { prefix, i };
}

// Plain text with escaped meta characters, or nothing if the pattern is more than that.
static std::optional<std::string> parsePlainText(std::string_view pattern) {
    std::string text;
    for(size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if(c == '\\') {
            if(i + 1 >= pattern.size() || !isRegexMetaChar(pattern[i + 1]))
                return {};
            c = pattern[++i];
        } else if(isRegexMetaChar(c)) {
            return {};
        }
        text += c;
    }
    return text;
}

static bool startsWith(std::string_view text, std::string_view start) {
    return text.substr(0, start.size()) == start;
}

static void classifyComment(CommentPattern& comment, std::string_view rest) {
    const static std::vector<std::string_view> ANY_CHAR_RUNS{ "[\\s\\S]*", "[\\S\\s]*", "[^]*" };
    if(rest.empty()) {
        if(!comment.literalPrefix.empty())
            comment.shape = CommentShape::LITERAL;
        return;
    }
    if(rest == ".*") {
        comment.shape = CommentShape::TO_LINE_END;
        return;
    }
    for(auto run : ANY_CHAR_RUNS) {
        if(rest == run) {
            comment.shape = CommentShape::TO_INPUT_END;
            return;
        }
        if(startsWith(rest, run) && rest.size() > run.size() && rest[run.size()] == '?') {
            auto terminator = parsePlainText(rest.substr(run.size() + 1));
            if(terminator && !terminator->empty()) {
                comment.shape = CommentShape::UNTIL_TERMINATOR;
                comment.terminator = std::move(*terminator);
                comment.crossesLines = true;
            }
            return;
        }
    }
    if(startsWith(rest, ".*?")) {
        auto terminator = parsePlainText(rest.substr(3));
        if(terminator && !terminator->empty()) {
            comment.shape = CommentShape::UNTIL_TERMINATOR;
            comment.terminator = std::move(*terminator);
        }
    }
}

CommentPattern makeCommentPattern(std::string source) {
    try {
        std::regex regex{ source };
        auto [prefix, prefixEnd] = computeLiteralPrefix(source);
        CommentPattern comment{ .source = source, .regex = std::move(regex), .literalPrefix = std::move(prefix) };
        classifyComment(comment, std::string_view{ source }.substr(prefixEnd));
        return comment;
    } catch(const std::regex_error& e) {
        throw GrammarError{ "Invalid comment pattern '" + source + "': " + e.what() };
    }
}

PegTokenizer::PegTokenizer(std::string code)
: mCode(std::move(code)), mLines(mCode) {
}

void PegTokenizer::applyEdit(size_t offset, size_t oldLength, std::string_view newText) {
    mCode.replace(offset, oldLength, newText);
    mLines.applyEdit(offset, oldLength, newText);
}

void PegTokenizer::markRead(ReadSet& reads, size_t start, size_t end) const {
    reads.add(start, std::min(end, mCode.size() + 1));
}

bool PegTokenizer::isDigit(size_t offset) const {
    return offset < mCode.size() && isdigit(static_cast<unsigned char>(mCode[offset]));
}

bool PegTokenizer::isEmpty(ParsingState state) const {
    return state.offset >= mCode.size();
}

std::string_view PegTokenizer::getSlice(size_t start, size_t end) const {
    std::string_view code{ mCode };
    start = std::min(start, code.size());
    return code.substr(start, std::min(end, code.size()) - start);
}

ParsingState PegTokenizer::skipWhitespaces(ParsingState state, ReadSet& reads) const {
    const static std::string WHITESPACE_CHARS{ " \t\r\n" };
    auto start = state.offset;
    while(state.offset < mCode.size() && WHITESPACE_CHARS.find(mCode[state.offset]) != std::string::npos) {
        state.offset += 1;
    }
    markRead(reads, start, state.offset + 1);
    return state;
}

ParsingState PegTokenizer::skipIgnored(ParsingState state, const std::vector<CommentPattern>& comments, ReadSet& reads) const {
    bool changed = true;
    while(changed) {
        changed = false;
        auto afterWhitespaces = skipWhitespaces(state, reads);
        if(afterWhitespaces.offset != state.offset) {
            changed = true;
            state = afterWhitespaces;
        }
        for(auto& comment : comments) {
            auto afterComment = matchComment(state, comment, reads);
            if(afterComment) {
                changed = true;
                state = *afterComment;
            }
        }
    }
    return state;
}

std::optional<ParsingState> PegTokenizer::matchComment(ParsingState state, const CommentPattern& comment, ReadSet& reads) const {
    const auto& prefix = comment.literalPrefix;
    for(size_t i = 0; i < prefix.size(); ++i) {
        if(state.offset + i >= mCode.size() || mCode[state.offset + i] != prefix[i]) {
            markRead(reads, state.offset, state.offset + i + 1);
            return {};
        }
    }
    auto bodyStart = state.offset + prefix.size();
    size_t end = 0;
    switch(comment.shape) {
    case CommentShape::LITERAL:
        markRead(reads, state.offset, bodyStart);
        return ParsingState{ bodyStart };
    case CommentShape::TO_LINE_END:
        end = mCode.find_first_of("\r\n", bodyStart);
        if(end == std::string::npos)
            end = mCode.size();
        markRead(reads, state.offset, end + 1);
        break;
    case CommentShape::TO_INPUT_END:
        end = mCode.size();
        markRead(reads, state.offset, end + 1);
        break;
    case CommentShape::UNTIL_TERMINATOR: {
        auto& terminator = comment.terminator;
        if(comment.crossesLines) {
            auto found = mCode.find(terminator, bodyStart);
            if(found == std::string::npos) {
                markRead(reads, state.offset, mCode.size() + 1);
                return {};
            }
            end = found + terminator.size();
            markRead(reads, state.offset, end);
            break;
        }
        auto lineEnd = mCode.find_first_of("\r\n", bodyStart);
        if(lineEnd == std::string::npos)
            lineEnd = mCode.size();
        // the terminator may begin at the line break but not after it
        auto searchEnd = std::min(mCode.size(), lineEnd + terminator.size());
        auto found = std::string_view{ mCode }.substr(bodyStart, searchEnd - bodyStart).find(terminator);
        if(found == std::string_view::npos) {
            markRead(reads, state.offset, searchEnd + 1);
            return {};
        }
        end = bodyStart + found + terminator.size();
        markRead(reads, state.offset, end);
        break;
    }
    case CommentShape::REGEX:
        return matchCommentRegex(state, comment, reads);
    }
    if(end == state.offset) {
        return {};
    }
    return ParsingState{ end };
}

std::optional<ParsingState> PegTokenizer::matchCommentRegex(ParsingState state, const CommentPattern& comment, ReadSet& reads) const {
    // std::regex recurses per character, so it only ever sees a bounded window
    auto windowEnd = std::min(mCode.size(), state.offset + MAX_REGEX_COMMENT_LENGTH);
    auto flags = std::regex_constants::match_continuous;
    if(windowEnd < mCode.size()) {
        flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
    }
    markRead(reads, state.offset, windowEnd + 1);
    auto begin = mCode.cbegin();
    std::smatch match;
    if(!std::regex_search(begin + static_cast<ptrdiff_t>(state.offset), begin + static_cast<ptrdiff_t>(windowEnd), match, comment.regex, flags)
        || match.length() == 0) {
        return {};
    }
    return ParsingState{ state.offset + static_cast<size_t>(match.length()) };
}

std::optional<ParsingState> PegTokenizer::matchString(ParsingState state, std::string_view string, bool wordBoundary, ReadSet& reads) const {
    auto end = state.offset + string.size();
    markRead(reads, state.offset, end + (wordBoundary ? 1 : 0));
    if(end > mCode.size()) {
        return {};
    }
    if(std::string_view{ mCode }.substr(state.offset, string.size()) != string) {
        return {};
    }
    if(wordBoundary && end < mCode.size() && isWordChar(mCode[end])) {
        return {};
    }
    return ParsingState{ end };
}

std::optional<ParsingState> PegTokenizer::matchCharClass(ParsingState state, const std::regex& charClass, ReadSet& reads) const {
    markRead(reads, state.offset, state.offset + 1);
    if(isEmpty(state)) {
        return {};
    }
    auto it = mCode.cbegin() + static_cast<ptrdiff_t>(state.offset);
    if(!std::regex_match(it, it + 1, charClass)) {
        return {};
    }
    return ParsingState{ state.offset + 1 };
}

std::optional<ParsingState> PegTokenizer::matchAnyChar(ParsingState state, ReadSet& reads) const {
    markRead(reads, state.offset, state.offset + 1);
    if(isEmpty(state)) {
        return {};
    }
    return ParsingState{ state.offset + 1 };
}

std::optional<ParsingState> PegTokenizer::matchNumber(ParsingState state, ReadSet& reads) const {
    auto pos = state.offset;
    while(isDigit(pos)) {
        ++pos;
    }
    if(pos == state.offset) {
        markRead(reads, state.offset, state.offset + 1);
        return {};
    }
    if(pos < mCode.size() && mCode[pos] == '.' && isDigit(pos + 1)) {
        pos += 1;
        while(isDigit(pos)) {
            ++pos;
        }
    }
    if(pos < mCode.size() && (mCode[pos] == 'e' || mCode[pos] == 'E')) {
        auto exponent = pos + 1;
        if(exponent < mCode.size() && (mCode[exponent] == '+' || mCode[exponent] == '-')) {
            exponent += 1;
        }
        if(isDigit(exponent)) {
            pos = exponent;
            while(isDigit(pos)) {
                ++pos;
            }
        }
    }
    // a rejected fraction or exponent looks up to three characters ahead
    markRead(reads, state.offset, pos + 3);
    return ParsingState{ pos };
}

std::optional<ParsingState> PegTokenizer::matchQuoted(ParsingState state, ReadSet& reads) const {
    if(isEmpty(state) || (mCode[state.offset] != '"' && mCode[state.offset] != '\'')) {
        markRead(reads, state.offset, state.offset + 1);
        return {};
    }
    auto quote = mCode[state.offset];
    auto i = state.offset + 1;
    while(i < mCode.size()) {
        if(mCode[i] == '\\' && i + 1 < mCode.size()) {
            i += 2;
        } else if(mCode[i] == quote) {
            markRead(reads, state.offset, i + 1);
            return ParsingState{ i + 1 };
        } else {
            i += 1;
        }
    }
    markRead(reads, state.offset, mCode.size() + 1);
    return {};
}

std::optional<ParsingState> PegTokenizer::matchIdentifier(ParsingState state, ReadSet& reads) const {
    if(isEmpty(state) || !(isalpha(static_cast<unsigned char>(mCode[state.offset])) || mCode[state.offset] == '_')) {
        markRead(reads, state.offset, state.offset + 1);
        return {};
    }
    auto pos = state.offset + 1;
    while(pos < mCode.size() && isWordChar(mCode[pos])) {
        ++pos;
    }
    markRead(reads, state.offset, pos + 1);
    return ParsingState{ pos };
}

std::optional<ParsingState> PegTokenizer::matchNewline(ParsingState state, ReadSet& reads) const {
    markRead(reads, state.offset, state.offset + 2);
    if(isEmpty(state)) {
        return {};
    }
    if(mCode[state.offset] == '\n') {
        return ParsingState{ state.offset + 1 };
    }
    if(mCode.compare(state.offset, 2, "\r\n") == 0) {
        return ParsingState{ state.offset + 2 };
    }
    return {};
}

std::pair<size_t, size_t> PegTokenizer::getPosition(ParsingState state) const {
    return mLines.getPosition(std::min(state.offset, mCode.size()));
}

}
