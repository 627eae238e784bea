#include "peg_parser/PegGrammar.hpp"
#include "peg_parser/PegParsingExpression.hpp"
#include "peg_parser/PegParsingExpressionParser.hpp"
#include <unordered_set>

namespace peg {

static const std::vector<std::string> DEFAULT_COMMENT_PATTERNS{ "//.*", R"(/\*[\s\S]*?\*/)" };

RuleDefinition& RuleDefinition::operator<<(std::string_view patternText) {
    mGrammar.addRule(mName, stringToParsingExpression(patternText));
    return *this;
}

Grammar::Grammar(std::string name)
: mName(std::move(name)) {
    setCommentPatterns(DEFAULT_COMMENT_PATTERNS);
}

NamedRule& Grammar::addRule(std::string name, sp<ParsingExpression> pattern, RuleOptions options) {
    auto nodeType = options.nodeType.empty() ? name : std::move(options.nodeType);
    auto it = mRuleIds.find(name);
    if(it != mRuleIds.end()) {
        auto& rule = mRules.at(it->second);
        rule.pattern = std::move(pattern);
        rule.nodeType = std::move(nodeType);
        rule.isFragment = options.isFragment;
        rule.description = std::move(options.description);
        return rule;
    }
    auto id = static_cast<RuleId>(mRules.size());
    mRuleIds.emplace(name, id);
    return mRules.emplace_back(NamedRule{
        .name = std::move(name),
        .id = id,
        .pattern = std::move(pattern),
        .nodeType = std::move(nodeType),
        .isFragment = options.isFragment,
        .description = std::move(options.description) });
}

RuleDefinition Grammar::operator[](std::string name) {
    return RuleDefinition{ *this, std::move(name) };
}

const NamedRule* Grammar::getRule(std::string_view name) const {
    auto id = findRuleId(name);
    if(!id)
        return nullptr;
    return &mRules.at(*id);
}

const NamedRule& Grammar::getRule(RuleId id) const {
    return mRules.at(id);
}

std::optional<RuleId> Grammar::findRuleId(std::string_view name) const {
    auto it = mRuleIds.find(std::string{ name });
    if(it == mRuleIds.end())
        return {};
    return it->second;
}

std::string Grammar::getStartRule() const {
    if(mStartRule)
        return *mStartRule;
    if(mRuleIds.count("program") > 0 || mRules.empty())
        return "program";
    return mRules.front().name;
}

void Grammar::setCommentPatterns(const std::vector<std::string>& patterns) {
    std::vector<CommentPattern> compiled;
    for(auto& pattern : patterns) {
        compiled.emplace_back(makeCommentPattern(pattern));
    }
    mCommentPatterns = std::move(compiled);
}

static void checkReferences(const ParsingExpression& expr, const Grammar& grammar, const std::string& ruleName, std::vector<std::string>& errors) {
    if(expr.getKind() == ExpressionKind::RULE_REF) {
        const auto& target = static_cast<const NonTerminalParsingExpression&>(expr).getName();
        auto tokenKind = tokenKindFromString(target);
        if(!grammar.getRule(target) && !(tokenKind && isImplementedToken(*tokenKind))) {
            errors.emplace_back("Rule '" + ruleName + "' references undefined rule '" + target + "'");
        }
    }
    for(auto& child : expr.getChildren()) {
        checkReferences(*child, grammar, ruleName, errors);
    }
}

std::vector<std::string> Grammar::validate() const {
    std::vector<std::string> errors;
    for(auto& rule : mRules) {
        checkReferences(*rule.pattern, *this, rule.name, errors);
    }
    auto startRule = getStartRule();
    if(!getRule(startRule)) {
        errors.emplace_back("Start rule '" + startRule + "' is not defined");
    }
    for(auto& name : findLeftRecursiveRules()) {
        errors.emplace_back("Rule '" + name + "' is left-recursive (not allowed in PEG)");
    }
    return errors;
}

std::vector<std::string> Grammar::findLeftRecursiveRules() const {
    std::vector<std::string> ret;
    for(auto& rule : mRules) {
        if(isLeftRecursive(rule))
            ret.push_back(rule.name);
    }
    return ret;
}

bool Grammar::isLeftRecursive(const NamedRule& rule) const {
    // depth-first walk over the rules reachable without consuming input
    std::unordered_set<std::string> visited;
    std::vector<std::string> pending;
    rule.pattern->collectLeadingRuleRefs(pending);
    while(!pending.empty()) {
        auto name = std::move(pending.back());
        pending.pop_back();
        if(name == rule.name)
            return true;
        if(!visited.insert(name).second)
            continue;
        auto next = getRule(name);
        if(next) {
            next->pattern->collectLeadingRuleRefs(pending);
        }
    }
    return false;
}

std::string Grammar::dump() const {
    std::string ret;
    for(auto& rule : mRules) {
        ret += rule.name + " <- " + rule.pattern->dump() + "\n";
    }
    return ret;
}

}
