#include "peg_parser/PegBuilder.hpp"
#include "peg_parser/PegExceptions.hpp"

namespace peg {

GrammarBuilder::GrammarBuilder(std::string name)
: mGrammar(std::make_shared<Grammar>(std::move(name))) {
}

GrammarBuilder& GrammarBuilder::rule(std::string name, std::string description) {
    auto& rule = mGrammar->addRule(std::move(name), std::make_shared<SequenceParsingExpression>(std::vector<sp<ParsingExpression>>{}), RuleOptions{ .description = std::move(description) });
    mCurrentRule = rule.id;
    return *this;
}

const NamedRule& GrammarBuilder::currentRule() const {
    if(!mCurrentRule) {
        throw GrammarError{ "No rule started, call rule() first" };
    }
    return mGrammar->getRule(*mCurrentRule);
}

GrammarBuilder& GrammarBuilder::setPattern(sp<ParsingExpression> pattern) {
    const auto& rule = currentRule();
    mGrammar->addRule(rule.name, std::move(pattern), RuleOptions{ .nodeType = rule.nodeType, .isFragment = rule.isFragment, .description = rule.description });
    return *this;
}

GrammarBuilder& GrammarBuilder::fragment(bool isFragment) {
    const auto& rule = currentRule();
    mGrammar->addRule(rule.name, rule.pattern, RuleOptions{ .nodeType = rule.nodeType, .isFragment = isFragment, .description = rule.description });
    return *this;
}

GrammarBuilder& GrammarBuilder::nodeType(std::string type) {
    const auto& rule = currentRule();
    mGrammar->addRule(rule.name, rule.pattern, RuleOptions{ .nodeType = std::move(type), .isFragment = rule.isFragment, .description = rule.description });
    return *this;
}

GrammarBuilder& GrammarBuilder::start(std::string ruleName) {
    mGrammar->setStartRule(std::move(ruleName));
    return *this;
}

GrammarBuilder& GrammarBuilder::skipWhitespace(bool skip) {
    mGrammar->setSkipWhitespace(skip);
    return *this;
}

GrammarBuilder& GrammarBuilder::comments(const std::vector<std::string>& patterns) {
    mGrammar->setCommentPatterns(patterns);
    return *this;
}

sp<Grammar> GrammarBuilder::build() {
    auto errors = mGrammar->validate();
    if(!errors.empty()) {
        std::string msg = "Grammar validation errors: ";
        for(size_t i = 0; i < errors.size(); ++i) {
            msg += errors.at(i);
            if(i < errors.size() - 1) {
                msg += "; ";
            }
        }
        throw GrammarError{ msg };
    }
    return mGrammar;
}

sp<ParsingExpression> GrammarBuilder::seq(std::initializer_list<sp<ParsingExpression>> items) {
    if(items.size() == 1) {
        return *items.begin();
    }
    return std::make_shared<SequenceParsingExpression>(std::vector<sp<ParsingExpression>>{ items });
}
sp<ParsingExpression> GrammarBuilder::choice(std::initializer_list<sp<ParsingExpression>> items) {
    if(items.size() == 1) {
        return *items.begin();
    }
    return std::make_shared<ChoiceParsingExpression>(std::vector<sp<ParsingExpression>>{ items });
}
sp<ParsingExpression> GrammarBuilder::star(sp<ParsingExpression> item) {
    return std::make_shared<ZeroOrMoreParsingExpression>(std::move(item));
}
sp<ParsingExpression> GrammarBuilder::plus(sp<ParsingExpression> item) {
    return std::make_shared<OneOrMoreParsingExpression>(std::move(item));
}
sp<ParsingExpression> GrammarBuilder::opt(sp<ParsingExpression> item) {
    return std::make_shared<OptionalParsingExpression>(std::move(item));
}
sp<ParsingExpression> GrammarBuilder::lit(std::string text) {
    return std::make_shared<TerminalParsingExpression>(std::move(text));
}
sp<ParsingExpression> GrammarBuilder::ref(std::string ruleName) {
    return std::make_shared<NonTerminalParsingExpression>(std::move(ruleName));
}
sp<ParsingExpression> GrammarBuilder::token(TokenKind kind) {
    return std::make_shared<TokenParsingExpression>(kind);
}
sp<ParsingExpression> GrammarBuilder::ident() {
    return token(TokenKind::IDENT);
}
sp<ParsingExpression> GrammarBuilder::number() {
    return token(TokenKind::NUMBER);
}
sp<ParsingExpression> GrammarBuilder::string() {
    return token(TokenKind::STRING);
}
sp<ParsingExpression> GrammarBuilder::charClass(std::string pattern) {
    return std::make_shared<CharClassParsingExpression>(std::move(pattern));
}
sp<ParsingExpression> GrammarBuilder::anyChar() {
    return std::make_shared<AnyCharParsingExpression>();
}
sp<ParsingExpression> GrammarBuilder::notPred(sp<ParsingExpression> item) {
    return std::make_shared<NotParsingExpression>(std::move(item));
}
sp<ParsingExpression> GrammarBuilder::andPred(sp<ParsingExpression> item) {
    return std::make_shared<AndParsingExpression>(std::move(item));
}

}
