#include "parsercraft_lib/LanguageConfig.hpp"
#include "parsercraft_lib/Pipeline.hpp"
#include "parsercraft_lib/Util.hpp"
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegLogging.hpp"
#include <iostream>
#include <string>
#include <vector>

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] <grammar.peg|config.json> <source-file>...\n";
}

int main(int argc, char** argv) {
    using namespace parsercraft;
    std::vector<std::string> args;
    for(int i = 1; i < argc; ++i) {
        std::string arg{ argv[i] };
        if(arg == "-v" || arg == "--verbose") {
            peg::Logger::get().setFilter(peg::LogLevel::DEBUG);
        } else {
            args.emplace_back(std::move(arg));
        }
    }
    if(args.size() < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto pl = Pipeline::loadGrammarFile(args.at(0));
        for(auto& note : pl.getGrammar().getCompileNotes()) {
            std::cerr << "[Grammar] " << note << "\n";
        }
        auto diagnostics = pl.validateGrammar();
        if(!diagnostics.empty()) {
            for(auto& diagnostic : diagnostics) {
                std::cerr << "[Grammar] " << diagnostic << "\n";
            }
            return 1;
        }
        int exitCode = 0;
        for(size_t i = 1; i < args.size(); ++i) {
            try {
                peg::Stopwatch stopwatch{ "Parsing" };
                auto& tree = pl.addFile(args.at(i));
                stopwatch.stop();
                std::cout << tree.toJson().dump(2) << "\n";
            } catch(const peg::ParseException& e) {
                std::cerr << args.at(i) << ": " << e.what() << "\n";
                exitCode = 1;
            }
        }
        return exitCode;
    } catch(const peg::GrammarError& e) {
        std::cerr << "Invalid grammar: " << e.what() << "\n";
    } catch(const ConfigError& e) {
        std::cerr << "Invalid language config: " << e.what() << "\n";
    } catch(const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
    }
    return 1;
}
