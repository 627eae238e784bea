#pragma once

#include "peg_parser/PegGrammar.hpp"
#include <string>
#include <utility>
#include <vector>

namespace peg {

// Compiles grammar text, one "name <- pattern" rule per logical line.
// Lines without "<-" are skipped and reported via Grammar::getCompileNotes().
// Throws GrammarError if a pattern is malformed.
[[nodiscard]] sp<Grammar> compileGrammar(std::string_view grammarText, std::string grammarName = "custom");

struct GrammarConfig {
    std::string name = "custom";
    std::string start = "program";
    bool skipWhitespace = true;
    std::vector<std::string> comments{ "//.*" };
    // rule name and pattern, in declaration order
    std::vector<std::pair<std::string, std::string>> rules;
};

// Renders the rules into grammar text and compiles it. A config without rules yields defaultGrammar().
[[nodiscard]] sp<Grammar> grammarFromConfig(const GrammarConfig& config);

// Grammar for a small Python-like language.
[[nodiscard]] sp<Grammar> defaultGrammar();

}
