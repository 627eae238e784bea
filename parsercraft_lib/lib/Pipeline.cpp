#include "parsercraft_lib/Pipeline.hpp"
#include "parsercraft_lib/LanguageConfig.hpp"
#include "parsercraft_lib/Util.hpp"
#include "peg_parser/PegGrammarCompiler.hpp"
#include "peg_parser/PegLogging.hpp"
#include <filesystem>

namespace parsercraft {

Pipeline::Pipeline(peg::sp<const peg::Grammar> grammar, peg::InterpreterOptions options)
: mGrammar(std::move(grammar)), mOptions(options) {
}
Pipeline::Pipeline(const LanguageConfig& config, peg::InterpreterOptions options)
: Pipeline(config.buildGrammar(), options) {
}

Pipeline Pipeline::fromGrammarText(std::string_view grammarText, std::string grammarName) {
    return Pipeline{ peg::compileGrammar(grammarText, std::move(grammarName)) };
}

Pipeline Pipeline::loadGrammarFile(const std::string& path) {
    std::filesystem::path pathObj{ path };
    if(pathObj.extension() == ".json") {
        return Pipeline{ LanguageConfig::fromFile(path) };
    }
    auto grammarText = readFile(path);
    PEG_LOG_INFO("Loaded grammar ", path);
    return fromGrammarText(grammarText, pathObj.stem().string());
}

std::vector<std::string> Pipeline::validateGrammar() const {
    return mGrammar->validate();
}

peg::PegInterpreter& Pipeline::getInterpreter() {
    if(!mInterpreter) {
        mInterpreter = std::make_unique<peg::PegInterpreter>(mGrammar, mOptions);
    }
    return *mInterpreter;
}

const peg::SourceTree& Pipeline::addFile(const std::string& path) {
    auto fileContents = readFile(path);
    std::filesystem::path pathObj{ path };
    PEG_LOG_INFO("Parsing ", path);
    return addFileFromMemory(pathObj.stem().string(), std::move(fileContents));
}

const peg::SourceTree& Pipeline::addFileFromMemory(std::string name, std::string fileContents) {
    auto tree = getInterpreter().parse(std::move(fileContents));
    return mTrees.insert_or_assign(std::move(name), std::move(tree)).first->second;
}

const peg::SourceTree& Pipeline::getTree(const std::string& name) const {
    auto it = mTrees.find(name);
    if(it == mTrees.end()) {
        throw std::runtime_error{ "No parsed file named " + name };
    }
    return it->second;
}

std::vector<std::string> Pipeline::getFileNames() const {
    std::vector<std::string> ret;
    for(auto& [name, tree] : mTrees) {
        ret.push_back(name);
    }
    return ret;
}

peg::IncrementalParser& Pipeline::openDocument(const std::string& name, std::string contents) {
    auto parser = std::make_unique<peg::IncrementalParser>(mGrammar, mOptions);
    parser->parse(std::move(contents));
    auto& ret = *parser;
    mDocuments.insert_or_assign(name, std::move(parser));
    return ret;
}

peg::IncrementalParser& Pipeline::getDocument(const std::string& name) {
    auto it = mDocuments.find(name);
    if(it == mDocuments.end()) {
        throw std::runtime_error{ "No open document named " + name };
    }
    return *it->second;
}

void Pipeline::closeDocument(const std::string& name) {
    mDocuments.erase(name);
}

}
