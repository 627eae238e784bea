#pragma once

#include "peg_parser/PegGrammar.hpp"
#include "peg_parser/PegParsingExpression.hpp"
#include <initializer_list>
#include <string>

namespace peg {

// Fluent construction of a grammar without going through grammar text:
//
//   GrammarBuilder g{ "MyLang" };
//   g.rule("program").setPattern(g.star(g.ref("statement")));
//   g.rule("statement").setPattern(g.seq({ g.ident(), g.lit("="), g.number(), g.lit(";") }));
//   auto grammar = g.build();
class GrammarBuilder final {
public:
    explicit GrammarBuilder(std::string name = "custom");

    // Starts a new rule with an empty pattern; later calls apply to it.
    GrammarBuilder& rule(std::string name, std::string description = "");
    GrammarBuilder& setPattern(sp<ParsingExpression> pattern);
    GrammarBuilder& fragment(bool isFragment = true);
    GrammarBuilder& nodeType(std::string type);
    GrammarBuilder& start(std::string ruleName);
    GrammarBuilder& skipWhitespace(bool skip);
    GrammarBuilder& comments(const std::vector<std::string>& patterns);

    // Throws GrammarError listing the diagnostics if the grammar does not validate.
    [[nodiscard]] sp<Grammar> build();

    static sp<ParsingExpression> seq(std::initializer_list<sp<ParsingExpression>> items);
    static sp<ParsingExpression> choice(std::initializer_list<sp<ParsingExpression>> items);
    static sp<ParsingExpression> star(sp<ParsingExpression> item);
    static sp<ParsingExpression> plus(sp<ParsingExpression> item);
    static sp<ParsingExpression> opt(sp<ParsingExpression> item);
    static sp<ParsingExpression> lit(std::string text);
    static sp<ParsingExpression> ref(std::string ruleName);
    static sp<ParsingExpression> token(TokenKind kind);
    static sp<ParsingExpression> ident();
    static sp<ParsingExpression> number();
    static sp<ParsingExpression> string();
    static sp<ParsingExpression> charClass(std::string pattern);
    static sp<ParsingExpression> anyChar();
    static sp<ParsingExpression> notPred(sp<ParsingExpression> item);
    static sp<ParsingExpression> andPred(sp<ParsingExpression> item);

private:
    [[nodiscard]] const NamedRule& currentRule() const;

    sp<Grammar> mGrammar;
    std::optional<RuleId> mCurrentRule;
};

}
