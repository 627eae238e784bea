#pragma once

#include "peg_parser/PegForward.hpp"
#include "peg_parser/PegTokenizer.hpp"
#include "peg_parser/PegUtil.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace peg {

struct NamedRule {
    std::string name;
    RuleId id = 0;
    sp<ParsingExpression> pattern;
    // kind of the node the rule produces, the rule name unless overridden
    std::string nodeType;
    // fragments pass their values on to the caller instead of producing a node
    bool isFragment = false;
    std::string description;
};

struct RuleOptions {
    std::string nodeType;
    bool isFragment = false;
    std::string description;
};

class Grammar;

class RuleDefinition final {
public:
    RuleDefinition(Grammar& grammar, std::string name)
    : mGrammar(grammar), mName(std::move(name)) {
    }
    RuleDefinition& operator<<(std::string_view patternText);

private:
    Grammar& mGrammar;
    std::string mName;
};

class Grammar final {
public:
    explicit Grammar(std::string name = "custom");

    // Registers a rule or overwrites an existing one, keeping its id and position.
    NamedRule& addRule(std::string name, sp<ParsingExpression> pattern, RuleOptions options = {});
    RuleDefinition operator[](std::string name);

    [[nodiscard]] const NamedRule* getRule(std::string_view name) const;
    [[nodiscard]] const NamedRule& getRule(RuleId id) const;
    [[nodiscard]] std::optional<RuleId> findRuleId(std::string_view name) const;
    [[nodiscard]] const std::vector<NamedRule>& getRules() const {
        return mRules;
    }
    [[nodiscard]] size_t getRuleCount() const {
        return mRules.size();
    }

    [[nodiscard]] const std::string& getName() const {
        return mName;
    }
    void setStartRule(std::string name) {
        mStartRule = std::move(name);
    }
    // An explicitly set start rule, otherwise "program" if declared, otherwise the first rule.
    [[nodiscard]] std::string getStartRule() const;

    void setSkipWhitespace(bool skip) {
        mSkipWhitespace = skip;
    }
    [[nodiscard]] bool getSkipWhitespace() const {
        return mSkipWhitespace;
    }
    void setCommentPatterns(const std::vector<std::string>& patterns);
    [[nodiscard]] const std::vector<CommentPattern>& getCommentPatterns() const {
        return mCommentPatterns;
    }

    void addCompileNote(std::string note) {
        mCompileNotes.emplace_back(std::move(note));
    }
    // Problems the text compiler skipped over, e.g. lines without '<-'.
    [[nodiscard]] const std::vector<std::string>& getCompileNotes() const {
        return mCompileNotes;
    }

    [[nodiscard]] std::vector<std::string> validate() const;
    [[nodiscard]] std::vector<std::string> findLeftRecursiveRules() const;
    [[nodiscard]] std::string dump() const;

private:
    [[nodiscard]] bool isLeftRecursive(const NamedRule& rule) const;

    std::string mName;
    std::vector<NamedRule> mRules;
    std::unordered_map<std::string, RuleId> mRuleIds;
    std::optional<std::string> mStartRule;
    bool mSkipWhitespace = true;
    std::vector<CommentPattern> mCommentPatterns;
    std::vector<std::string> mCompileNotes;
};

}
