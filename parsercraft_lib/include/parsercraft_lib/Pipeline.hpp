#pragma once
#include "parsercraft_lib/Forward.hpp"
#include "peg_parser/PegIncrementalParser.hpp"
#include "peg_parser/PegInterpreter.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace parsercraft {

// Parses source files of one language and keeps their trees and open documents.
class Pipeline final {
public:
    explicit Pipeline(peg::sp<const peg::Grammar> grammar, peg::InterpreterOptions options = {});
    explicit Pipeline(const LanguageConfig& config, peg::InterpreterOptions options = {});

    [[nodiscard]] static Pipeline fromGrammarText(std::string_view grammarText, std::string grammarName = "custom");
    // *.json files are language configs, everything else is grammar text.
    [[nodiscard]] static Pipeline loadGrammarFile(const std::string& path);

    [[nodiscard]] std::vector<std::string> validateGrammar() const;
    [[nodiscard]] const peg::Grammar& getGrammar() const {
        return *mGrammar;
    }

    // The tree is stored under the file's stem.
    const peg::SourceTree& addFile(const std::string& path);
    const peg::SourceTree& addFileFromMemory(std::string name, std::string fileContents);
    [[nodiscard]] const peg::SourceTree& getTree(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> getFileNames() const;

    // Parses the document and keeps it open for edits. Reopening replaces the old state.
    peg::IncrementalParser& openDocument(const std::string& name, std::string contents);
    [[nodiscard]] peg::IncrementalParser& getDocument(const std::string& name);
    void closeDocument(const std::string& name);

private:
    peg::PegInterpreter& getInterpreter();

    peg::sp<const peg::Grammar> mGrammar;
    peg::InterpreterOptions mOptions;
    peg::up<peg::PegInterpreter> mInterpreter;
    std::map<std::string, peg::SourceTree> mTrees;
    std::map<std::string, peg::up<peg::IncrementalParser>> mDocuments;
};

}
