#pragma once
#include "peg_parser/PegGrammarCompiler.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace parsercraft {

// A language description as stored in a JSON file:
// {"name": ..., "grammar": {"name", "start", "skip_whitespace", "comments", "rules"}}
struct LanguageConfig {
    std::string name = "unnamed";
    // unset if the file has no grammar section or no rules
    std::optional<peg::GrammarConfig> grammar;

    // Throws ConfigError if a field has the wrong type.
    [[nodiscard]] static LanguageConfig fromJson(const nlohmann::ordered_json& json);
    [[nodiscard]] static LanguageConfig fromFile(const std::string& path);

    [[nodiscard]] peg::sp<peg::Grammar> buildGrammar() const;
};

}
