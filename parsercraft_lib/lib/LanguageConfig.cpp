#include "parsercraft_lib/LanguageConfig.hpp"
#include "parsercraft_lib/Util.hpp"
#include "peg_parser/PegLogging.hpp"

namespace parsercraft {

static peg::GrammarConfig grammarConfigFromJson(const nlohmann::ordered_json& json) {
    peg::GrammarConfig config;
    config.name = json.value("name", config.name);
    config.start = json.value("start", config.start);
    config.skipWhitespace = json.value("skip_whitespace", config.skipWhitespace);
    if(json.contains("comments")) {
        auto& comments = json.at("comments");
        if(!comments.is_array()) {
            throw ConfigError{ "'comments' must be a list of regular expressions" };
        }
        config.comments.clear();
        for(auto& comment : comments) {
            config.comments.push_back(comment.get<std::string>());
        }
    }
    if(json.contains("rules")) {
        auto& rules = json.at("rules");
        if(!rules.is_object()) {
            throw ConfigError{ "'rules' must map rule names to patterns" };
        }
        for(const auto& [name, pattern] : rules.items()) {
            if(!pattern.is_string()) {
                throw ConfigError{ "Pattern of rule '" + name + "' must be a string" };
            }
            config.rules.emplace_back(name, pattern.get<std::string>());
        }
    }
    return config;
}

LanguageConfig LanguageConfig::fromJson(const nlohmann::ordered_json& json) {
    if(!json.is_object()) {
        throw ConfigError{ "Language config must be a JSON object" };
    }
    LanguageConfig ret;
    try {
        ret.name = json.value("name", ret.name);
        if(json.contains("grammar")) {
            auto& grammar = json.at("grammar");
            if(!grammar.is_object()) {
                throw ConfigError{ "'grammar' must be an object" };
            }
            auto config = grammarConfigFromJson(grammar);
            if(!config.rules.empty()) {
                ret.grammar = std::move(config);
            }
        }
    } catch(const nlohmann::json::exception& e) {
        throw ConfigError{ std::string{ "Invalid language config: " } + e.what() };
    }
    return ret;
}

LanguageConfig LanguageConfig::fromFile(const std::string& path) {
    std::string contents;
    try {
        contents = readFile(path);
    } catch(const std::runtime_error& e) {
        throw ConfigError{ e.what() };
    }
    nlohmann::ordered_json json;
    try {
        json = nlohmann::ordered_json::parse(contents);
    } catch(const nlohmann::json::parse_error& e) {
        throw ConfigError{ "Invalid JSON in " + path + ": " + e.what() };
    }
    PEG_LOG_INFO("Loaded language config ", path);
    return fromJson(json);
}

peg::sp<peg::Grammar> LanguageConfig::buildGrammar() const {
    if(!grammar) {
        PEG_LOG_INFO("Language '", name, "' has no grammar rules, using the default grammar");
        return peg::defaultGrammar();
    }
    return peg::grammarFromConfig(*grammar);
}

}
