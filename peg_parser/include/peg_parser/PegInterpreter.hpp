#pragma once

#include "peg_parser/PegForward.hpp"
#include "peg_parser/PegGrammar.hpp"
#include "peg_parser/PegParsingExpression.hpp"
#include "peg_parser/PegSourceTree.hpp"
#include "peg_parser/PegStructs.hpp"
#include "peg_parser/PegTokenizer.hpp"
#include "peg_parser/PegUtil.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace peg {

struct InterpreterOptions {
    // maximum number of nested rule invocations
    size_t maxDepth = 1000;
};

// Packrat interpreter for a Grammar. Results are memoized per (rule, offset) for
// the duration of one parse call. The text of the last call is kept.
class PegInterpreter final {
public:
    explicit PegInterpreter(sp<const Grammar> grammar, InterpreterOptions options = {});

    [[nodiscard]] SourceTree parse(std::string source);
    [[nodiscard]] SourceTree parseRule(std::string_view ruleName, std::string source);
    // Changes the text of the last parse. Only parseRegion() reads the edited text.
    void editSource(size_t offset, size_t oldLength, std::string_view newText);
    // Matches a single rule at invokeOffset of the current text. Only succeeds if the
    // match ends exactly at expectedEnd. depth is the depth of the node it replaces.
    // The returned tree holds no text of its own.
    [[nodiscard]] std::optional<SourceTree> parseRegion(RuleId rule, size_t invokeOffset, size_t expectedEnd, size_t depth = 1);

    [[nodiscard]] const Grammar& getGrammar() const {
        return *mGrammar;
    }
    [[nodiscard]] const sp<const Grammar>& getGrammarPtr() const {
        return mGrammar;
    }
    [[nodiscard]] const InterpreterOptions& getOptions() const {
        return mOptions;
    }

    // Entry points for the parsing expressions.
    [[nodiscard]] MatchResult matchRule(std::string_view name, ParsingState state);
    [[nodiscard]] MatchResult matchToken(TokenKind kind, ParsingState state);
    [[nodiscard]] ParsingState skipIgnored(ParsingState state);
    [[nodiscard]] const PegTokenizer& getTokenizer() const {
        return *mTokenizer;
    }
    // Reads of the innermost running rule invocation.
    [[nodiscard]] ReadSet& getCurrentReads() {
        return mFrames.back().reads;
    }

private:
    struct Frame {
        ReadSet reads;
        // nodes produced by nested invocations, whether kept or not
        std::vector<NodeId> touched;
    };
    struct MemoKey {
        RuleId rule;
        size_t offset;
        bool operator==(const MemoKey& other) const {
            return rule == other.rule && offset == other.offset;
        }
    };
    struct MemoKeyHash {
        size_t operator()(const MemoKey& key) const {
            return std::hash<size_t>{}(key.offset * 31 + key.rule);
        }
    };

    void reset(std::string source);
    void releaseState();
    [[nodiscard]] MatchResult matchRuleById(RuleId id, ParsingState state);
    [[nodiscard]] MatchResult finishToken(ParsingState state, ParsingState start, const char* nodeType, SourceValue value, ParsingState end, ReadSet reads);
    [[nodiscard]] const MatchResult& memoize(MemoKey key, MatchResult result);
    void consumeResult(const MatchResult& result);
    void chargeDiscarded(Frame& frame, const MatchResult& kept) const;
    void collectSubtreeReads(NodeId id, ReadSet& reads) const;
    NodeId addNode(SourceNode node);
    // Turns the values of a finished match into the children or the value of a node.
    void fillNode(NodeId id, const MatchResult& match);
    void noteAttempt(std::string_view name, ParsingState state);
    [[nodiscard]] size_t currentDepth() const;
    [[noreturn]] void throwParseError() const;
    [[nodiscard]] SourceTree buildTree(NodeId root, ReadSet documentReads, std::string source) const;
    NodeId copyReachable(NodeId id, NodeId parent, std::vector<SourceNode>& nodes) const;

    sp<const Grammar> mGrammar;
    InterpreterOptions mOptions;
    up<PegTokenizer> mTokenizer;
    std::unordered_map<MemoKey, MatchResult, MemoKeyHash> mMemo;
    std::vector<SourceNode> mNodes;
    std::vector<Frame> mFrames;
    size_t mDepthOffset = 0;
    size_t mFurthestOffset = 0;
    std::string mFurthestRule;
};

}
