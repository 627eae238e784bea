#include "peg_parser/PegGrammarCompiler.hpp"
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegParsingExpression.hpp"
#include "peg_parser/PegParsingExpressionParser.hpp"
#include <regex>
#include <sstream>

namespace peg {

static const char* DEFAULT_GRAMMAR_TEXT = R"(
program     <- statement*
statement   <- function_def / if_stmt / while_stmt / for_stmt / return_stmt / assignment / expr_stmt
function_def <- 'def' IDENT '(' param_list? ')' ':' block
param_list  <- IDENT (',' IDENT)*
if_stmt     <- 'if' expr ':' block ('elif' expr ':' block)* ('else' ':' block)?
while_stmt  <- 'while' expr ':' block
for_stmt    <- 'for' IDENT 'in' expr ':' block
return_stmt <- 'return' expr?
assignment  <- IDENT '=' expr
expr_stmt   <- expr
block       <- statement+
expr        <- comparison
comparison  <- addition (('==' / '!=' / '<=' / '>=' / '<' / '>') addition)*
addition    <- multiplication (('+' / '-') multiplication)*
multiplication <- unary (('*' / '/' / '%') unary)*
unary       <- ('-' / '!') unary / call
call        <- primary ('(' arg_list? ')')*
arg_list    <- expr (',' expr)*
primary     <- NUMBER / STRING / IDENT / '(' expr ')' / list_literal
list_literal <- '[' (expr (',' expr)*)? ']'
)";

static std::string trim(std::string_view text) {
    const char* WHITESPACE_CHARS = " \t\r\n";
    auto start = text.find_first_not_of(WHITESPACE_CHARS);
    if(start == std::string_view::npos)
        return "";
    auto end = text.find_last_not_of(WHITESPACE_CHARS);
    return std::string{ text.substr(start, end - start + 1) };
}

// Joins physical lines into one logical line per rule.
static std::vector<std::string> splitLogicalLines(std::string_view grammarText) {
    std::vector<std::string> ret;
    std::string current;
    std::istringstream stream{ std::string{ grammarText } };
    std::string line;
    while(std::getline(stream, line)) {
        auto stripped = trim(line);
        if(stripped.empty() || stripped.front() == '#') {
            continue;
        }
        bool continuation = !current.empty() && (isspace(static_cast<unsigned char>(line.front())) || line.front() == '|')
            && stripped.find("<-") == std::string::npos;
        if(continuation) {
            if(stripped.front() == '|') {
                // "| alternative" continues an ordered choice
                stripped.front() = '/';
            }
            current += " " + stripped;
        } else {
            if(!current.empty()) {
                ret.emplace_back(std::move(current));
            }
            current = std::move(stripped);
        }
    }
    if(!current.empty()) {
        ret.emplace_back(std::move(current));
    }
    return ret;
}

static bool usesReservedToken(const ParsingExpression& expr) {
    if(expr.getKind() == ExpressionKind::TOKEN_REF) {
        return !isImplementedToken(static_cast<const TokenParsingExpression&>(expr).getTokenKind());
    }
    for(auto& child : expr.getChildren()) {
        if(usesReservedToken(*child))
            return true;
    }
    return false;
}

sp<Grammar> compileGrammar(std::string_view grammarText, std::string grammarName) {
    static const std::regex RULE_REGEX{ R"((\w+)\s*<-\s*(.*))" };
    auto grammar = std::make_shared<Grammar>(std::move(grammarName));
    for(auto& ruleText : splitLogicalLines(grammarText)) {
        std::smatch match;
        if(!std::regex_match(ruleText, match, RULE_REGEX)) {
            PEG_LOG_WARN("Skipping grammar line without '<-': ", ruleText);
            grammar->addCompileNote("Skipped line without '<-': " + ruleText);
            continue;
        }
        auto name = match[1].str();
        sp<ParsingExpression> pattern;
        try {
            pattern = stringToParsingExpression(trim(match[2].str()));
        } catch(const GrammarError& e) {
            throw GrammarError{ "Rule '" + name + "': " + e.what() };
        }
        if(usesReservedToken(*pattern)) {
            PEG_LOG_WARN("Rule '", name, "' uses INDENT/DEDENT, which never match");
            grammar->addCompileNote("Rule '" + name + "' uses a reserved token that never matches");
        }
        grammar->addRule(std::move(name), std::move(pattern));
    }
    PEG_LOG_DEBUG("Compiled grammar '", grammar->getName(), "' with ", grammar->getRuleCount(), " rules");
    return grammar;
}

sp<Grammar> grammarFromConfig(const GrammarConfig& config) {
    if(config.rules.empty()) {
        return defaultGrammar();
    }
    std::string grammarText;
    for(auto& [name, pattern] : config.rules) {
        grammarText += name + " <- " + pattern + "\n";
    }
    auto grammar = compileGrammar(grammarText, config.name);
    grammar->setStartRule(config.start);
    grammar->setSkipWhitespace(config.skipWhitespace);
    grammar->setCommentPatterns(config.comments);
    return grammar;
}

sp<Grammar> defaultGrammar() {
    return compileGrammar(DEFAULT_GRAMMAR_TEXT, "default");
}

}
