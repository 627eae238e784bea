#pragma once
#include "peg_parser/PegStructs.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace peg {

// How a comment is matched. Common shapes are scanned directly; everything
// else goes through the regex on a bounded window of text.
enum class CommentShape {
    LITERAL,
    TO_LINE_END,
    TO_INPUT_END,
    UNTIL_TERMINATOR,
    REGEX,
};

// Longest text a REGEX shaped comment can match.
constexpr size_t MAX_REGEX_COMMENT_LENGTH = 4096;

// A comment regex together with the plain text every match has to start with.
struct CommentPattern {
    std::string source;
    std::regex regex;
    std::string literalPrefix;
    CommentShape shape = CommentShape::REGEX;
    // UNTIL_TERMINATOR only
    std::string terminator;
    bool crossesLines = false;
};

CommentPattern makeCommentPattern(std::string source);

// Character-level matching on one source text. Every operation records the
// offsets it looked at in the given ReadSet.
class PegTokenizer {
public:
    explicit PegTokenizer(std::string code);
    // Replaces [offset, offset + oldLength) with newText.
    void applyEdit(size_t offset, size_t oldLength, std::string_view newText);
    [[nodiscard]] const std::string& getCode() const {
        return mCode;
    }
    [[nodiscard]] size_t size() const {
        return mCode.size();
    }
    [[nodiscard]] bool isEmpty(ParsingState) const;
    [[nodiscard]] std::string_view getSlice(size_t start, size_t end) const;
    [[nodiscard]] ParsingState skipWhitespaces(ParsingState, ReadSet& reads) const;
    [[nodiscard]] ParsingState skipIgnored(ParsingState, const std::vector<CommentPattern>& comments, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchComment(ParsingState, const CommentPattern& comment, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchString(ParsingState, std::string_view string, bool wordBoundary, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchCharClass(ParsingState, const std::regex& charClass, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchAnyChar(ParsingState, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchNumber(ParsingState, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchQuoted(ParsingState, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchIdentifier(ParsingState, ReadSet& reads) const;
    [[nodiscard]] std::optional<ParsingState> matchNewline(ParsingState, ReadSet& reads) const;
    [[nodiscard]] std::pair<size_t, size_t> getPosition(ParsingState state) const;

private:
    void markRead(ReadSet& reads, size_t start, size_t end) const;
    [[nodiscard]] bool isDigit(size_t offset) const;
    [[nodiscard]] std::optional<ParsingState> matchCommentRegex(ParsingState, const CommentPattern& comment, ReadSet& reads) const;

    std::string mCode;
    LineTable mLines;
};

}
