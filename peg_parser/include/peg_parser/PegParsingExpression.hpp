#pragma once

#include "peg_parser/PegForward.hpp"
#include "peg_parser/PegStructs.hpp"
#include "peg_parser/PegUtil.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace peg {

enum class ExpressionKind {
    SEQUENCE,
    CHOICE,
    ZERO_OR_MORE,
    ONE_OR_MORE,
    OPTIONAL,
    AND_PREDICATE,
    NOT_PREDICATE,
    LITERAL,
    CHAR_CLASS,
    ANY_CHAR,
    RULE_REF,
    TOKEN_REF,
};

const char* expressionKindToString(ExpressionKind kind);

enum class TokenKind {
    NUMBER,
    STRING,
    IDENT,
    NEWLINE,
    END_OF_INPUT,
    // reserved, never match
    INDENT,
    DEDENT,
};

constexpr size_t TOKEN_KIND_COUNT = 7;

const char* tokenKindToString(TokenKind kind);
std::optional<TokenKind> tokenKindFromString(std::string_view name);
// NUMBER, STRING, IDENT, NEWLINE and EOF
bool isImplementedToken(TokenKind kind);

class ParsingExpression {
public:
    virtual ~ParsingExpression() = default;
    [[nodiscard]] virtual MatchResult match(ParsingState state, PegInterpreter& interpreter) const = 0;
    [[nodiscard]] virtual std::string dump() const = 0;
    [[nodiscard]] virtual ExpressionKind getKind() const = 0;
    // Names of the rules this expression may invoke before consuming any input.
    virtual void collectLeadingRuleRefs(std::vector<std::string>& names) const = 0;
    [[nodiscard]] virtual const std::vector<sp<ParsingExpression>>& getChildren() const;

    [[nodiscard]] const std::optional<std::string>& getLabel() const {
        return mLabel;
    }
    void setLabel(std::string label) {
        mLabel = std::move(label);
    }

protected:
    [[nodiscard]] std::string dumpLabel() const;

private:
    std::optional<std::string> mLabel;
};

class TerminalParsingExpression : public ParsingExpression {
public:
    explicit TerminalParsingExpression(std::string value);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::LITERAL;
    }
    void collectLeadingRuleRefs(std::vector<std::string>&) const override { }
    [[nodiscard]] const std::string& getValue() const {
        return mValue;
    }

private:
    std::string mValue;
    bool mWordBoundary;
};

class CharClassParsingExpression : public ParsingExpression {
public:
    explicit CharClassParsingExpression(std::string pattern);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::CHAR_CLASS;
    }
    void collectLeadingRuleRefs(std::vector<std::string>&) const override { }

private:
    std::string mPattern;
    std::regex mRegex;
};

class AnyCharParsingExpression : public ParsingExpression {
public:
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::ANY_CHAR;
    }
    void collectLeadingRuleRefs(std::vector<std::string>&) const override { }
};

class NonTerminalParsingExpression : public ParsingExpression {
public:
    explicit NonTerminalParsingExpression(std::string value);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::RULE_REF;
    }
    void collectLeadingRuleRefs(std::vector<std::string>& names) const override {
        names.push_back(mNonTerminal);
    }
    [[nodiscard]] const std::string& getName() const {
        return mNonTerminal;
    }

private:
    std::string mNonTerminal;
};

class TokenParsingExpression : public ParsingExpression {
public:
    explicit TokenParsingExpression(TokenKind kind);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::TOKEN_REF;
    }
    void collectLeadingRuleRefs(std::vector<std::string>&) const override { }
    [[nodiscard]] TokenKind getTokenKind() const {
        return mKind;
    }

private:
    TokenKind mKind;
};

class UnaryParsingExpression : public ParsingExpression {
public:
    explicit UnaryParsingExpression(sp<ParsingExpression> child);
    void collectLeadingRuleRefs(std::vector<std::string>& names) const override {
        mChildren.front()->collectLeadingRuleRefs(names);
    }
    [[nodiscard]] const std::vector<sp<ParsingExpression>>& getChildren() const override {
        return mChildren;
    }

protected:
    [[nodiscard]] const ParsingExpression& getChild() const {
        return *mChildren.front();
    }
    [[nodiscard]] std::string dumpChild(const char* prefix, const char* suffix) const;

private:
    std::vector<sp<ParsingExpression>> mChildren;
};

class OptionalParsingExpression : public UnaryParsingExpression {
public:
    using UnaryParsingExpression::UnaryParsingExpression;
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::OPTIONAL;
    }
};

class OneOrMoreParsingExpression : public UnaryParsingExpression {
public:
    using UnaryParsingExpression::UnaryParsingExpression;
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::ONE_OR_MORE;
    }
};

class ZeroOrMoreParsingExpression : public UnaryParsingExpression {
public:
    using UnaryParsingExpression::UnaryParsingExpression;
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::ZERO_OR_MORE;
    }
};

class AndParsingExpression : public UnaryParsingExpression {
public:
    using UnaryParsingExpression::UnaryParsingExpression;
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::AND_PREDICATE;
    }
};

class NotParsingExpression : public UnaryParsingExpression {
public:
    using UnaryParsingExpression::UnaryParsingExpression;
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::NOT_PREDICATE;
    }
};

class SequenceParsingExpression : public ParsingExpression {
public:
    explicit SequenceParsingExpression(std::vector<sp<ParsingExpression>> children);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::SEQUENCE;
    }
    void collectLeadingRuleRefs(std::vector<std::string>& names) const override;
    [[nodiscard]] const std::vector<sp<ParsingExpression>>& getChildren() const override {
        return mChildren;
    }

private:
    std::vector<sp<ParsingExpression>> mChildren;
};

class ChoiceParsingExpression : public ParsingExpression {
public:
    explicit ChoiceParsingExpression(std::vector<sp<ParsingExpression>> children);
    [[nodiscard]] MatchResult match(ParsingState, PegInterpreter&) const override;
    [[nodiscard]] std::string dump() const override;
    [[nodiscard]] ExpressionKind getKind() const override {
        return ExpressionKind::CHOICE;
    }
    void collectLeadingRuleRefs(std::vector<std::string>& names) const override;
    [[nodiscard]] const std::vector<sp<ParsingExpression>>& getChildren() const override {
        return mChildren;
    }

private:
    std::vector<sp<ParsingExpression>> mChildren;
};

}
