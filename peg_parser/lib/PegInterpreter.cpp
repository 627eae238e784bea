#include "peg_parser/PegInterpreter.hpp"
#include "peg_parser/PegExceptions.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <unordered_set>

namespace peg {

static bool isBlank(const std::string& text) {
    return std::all_of(text.cbegin(), text.cend(), [](char c) {
        return isspace(static_cast<unsigned char>(c));
    });
}

static SourceValue parseNumber(std::string_view text) {
    if(text.find_first_of(".eE") == std::string_view::npos) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(ec == std::errc{} && ptr == text.data() + text.size()) {
            return value;
        }
    }
    return std::strtod(std::string{ text }.c_str(), nullptr);
}

PegInterpreter::PegInterpreter(sp<const Grammar> grammar, InterpreterOptions options)
: mGrammar(std::move(grammar)), mOptions(options), mTokenizer(std::make_unique<PegTokenizer>("")) {
    auto leftRecursive = mGrammar->findLeftRecursiveRules();
    if(!leftRecursive.empty()) {
        std::string names;
        for(auto& name : leftRecursive) {
            if(!names.empty())
                names += ", ";
            names += name;
        }
        throw GrammarError{ "Grammar '" + mGrammar->getName() + "' contains left-recursive rules: " + names };
    }
}

void PegInterpreter::reset(std::string source) {
    mTokenizer = std::make_unique<PegTokenizer>(std::move(source));
    releaseState();
}

void PegInterpreter::releaseState() {
    decltype(mMemo){}.swap(mMemo);
    std::vector<SourceNode>{}.swap(mNodes);
    mFrames.clear();
    mDepthOffset = 0;
    mFurthestOffset = 0;
    mFurthestRule.clear();
}

void PegInterpreter::editSource(size_t offset, size_t oldLength, std::string_view newText) {
    mTokenizer->applyEdit(offset, oldLength, newText);
}

SourceTree PegInterpreter::parse(std::string source) {
    return parseRule(mGrammar->getStartRule(), std::move(source));
}

SourceTree PegInterpreter::parseRule(std::string_view ruleName, std::string source) {
    Stopwatch stopwatch{ "PegInterpreter::parseRule" };
    reset(std::move(source));
    if(!mGrammar->findRuleId(ruleName)) {
        auto token = tokenKindFromString(ruleName);
        if(!token || !isImplementedToken(*token)) {
            throw GrammarError{ "Start rule '" + std::string{ ruleName } + "' is not defined" };
        }
    }
    mFrames.emplace_back();
    auto ret = matchRule(ruleName, ParsingState{});
    if(!ret.success) {
        throwParseError();
    }

    auto& tokenizer = *mTokenizer;
    auto end = mGrammar->getSkipWhitespace()
        ? tokenizer.skipIgnored(ret.state, mGrammar->getCommentPatterns(), getCurrentReads())
        : tokenizer.skipWhitespaces(ret.state, getCurrentReads());
    if(!tokenizer.isEmpty(end)) {
        auto [line, column] = tokenizer.getPosition(end);
        std::string snippet{ tokenizer.getSlice(end.offset, end.offset + 30) };
        throw SyntaxError{ "Unexpected input at line " + std::to_string(line) + ", column " + std::to_string(column) + ": '" + snippet + "'",
            end.offset, line, column, mFurthestRule, snippet };
    }

    NodeId root;
    if(ret.single && ret.single->isNode()) {
        root = ret.single->node;
    } else {
        // the start rule is a fragment, give its values a common parent
        auto [line, column] = tokenizer.getPosition(ParsingState{ 0 });
        root = addNode(SourceNode{
            .type = "Program",
            .line = line,
            .column = column,
            .start = 0,
            .end = ret.state.offset });
        fillNode(root, ret);
    }
    auto& documentFrame = mFrames.back();
    chargeDiscarded(documentFrame, ret);
    auto tree = buildTree(root, std::move(documentFrame.reads), tokenizer.getCode());
    PEG_LOG_DEBUG("Parsed ", tokenizer.size(), " bytes into ", tree.size(), " nodes, ", mMemo.size(), " memo entries");
    releaseState();
    return tree;
}

std::optional<SourceTree> PegInterpreter::parseRegion(RuleId rule, size_t invokeOffset, size_t expectedEnd, size_t depth) {
    releaseState();
    mDepthOffset = depth > 0 ? depth - 1 : 0;
    mFrames.emplace_back();
    auto ret = matchRuleById(rule, ParsingState{ invokeOffset });
    if(!ret.success || ret.state.offset != expectedEnd || !ret.single || !ret.single->isNode()) {
        PEG_LOG_DEBUG("Region of rule '", mGrammar->getRule(rule).name, "' at ", invokeOffset, " does not end at ", expectedEnd);
        releaseState();
        return {};
    }
    auto tree = buildTree(ret.single->node, {}, "");
    releaseState();
    return tree;
}

MatchResult PegInterpreter::matchRule(std::string_view name, ParsingState state) {
    auto id = mGrammar->findRuleId(name);
    if(id) {
        return matchRuleById(*id, state);
    }
    auto token = tokenKindFromString(name);
    if(token && isImplementedToken(*token)) {
        return matchToken(*token, state);
    }
    noteAttempt(name, state);
    return MatchResult::failure(state);
}

MatchResult PegInterpreter::matchRuleById(RuleId id, ParsingState state) {
    MemoKey key{ id, state.offset };
    auto it = mMemo.find(key);
    if(it != mMemo.end()) {
        consumeResult(it->second);
        return it->second;
    }
    const auto& rule = mGrammar->getRule(id);
    if(currentDepth() >= mOptions.maxDepth) {
        throw ResourceExhaustedError{ "Maximum recursion depth of " + std::to_string(mOptions.maxDepth) + " exceeded in rule '" + rule.name + "'", currentDepth() + 1 };
    }
    mFrames.emplace_back();
    auto depth = currentDepth();
    auto start = skipIgnored(state);
    noteAttempt(rule.name, start);
    auto ret = rule.pattern->match(start, *this);
    auto frame = std::move(mFrames.back());
    mFrames.pop_back();

    MatchResult result;
    if(!ret.success) {
        result = MatchResult::failure(state);
        result.reads = std::move(frame.reads);
        for(auto node : frame.touched) {
            collectSubtreeReads(node, result.reads);
        }
    } else if(rule.isFragment) {
        chargeDiscarded(frame, ret);
        result = std::move(ret);
        result.reads = std::move(frame.reads);
    } else {
        chargeDiscarded(frame, ret);
        auto [line, column] = mTokenizer->getPosition(start);
        auto nodeId = addNode(SourceNode{
            .type = rule.nodeType,
            .line = line,
            .column = column,
            .start = start.offset,
            .end = ret.state.offset,
            .invokeOffset = state.offset,
            .rule = id,
            .depth = depth,
            .reads = std::move(frame.reads) });
        fillNode(nodeId, ret);
        result = MatchResult::value(ret.state, MatchFragment{ .node = nodeId, .offset = start.offset });
    }
    auto& stored = memoize(key, std::move(result));
    consumeResult(stored);
    return stored;
}

MatchResult PegInterpreter::matchToken(TokenKind kind, ParsingState state) {
    MemoKey key{ static_cast<RuleId>(mGrammar->getRuleCount() + static_cast<size_t>(kind)), state.offset };
    auto it = mMemo.find(key);
    if(it != mMemo.end()) {
        consumeResult(it->second);
        return it->second;
    }
    auto& tokenizer = *mTokenizer;
    ReadSet reads;
    auto start = mGrammar->getSkipWhitespace()
        ? tokenizer.skipIgnored(state, mGrammar->getCommentPatterns(), reads)
        : state;
    noteAttempt(tokenKindToString(kind), start);

    auto result = MatchResult::failure(state);
    switch(kind) {
    case TokenKind::NUMBER:
        if(auto end = tokenizer.matchNumber(start, reads)) {
            result = finishToken(state, start, "Number", parseNumber(tokenizer.getSlice(start.offset, end->offset)), *end, std::move(reads));
        }
        break;
    case TokenKind::STRING:
        if(auto end = tokenizer.matchQuoted(start, reads)) {
            result = finishToken(state, start, "String", std::string{ tokenizer.getSlice(start.offset + 1, end->offset - 1) }, *end, std::move(reads));
        }
        break;
    case TokenKind::IDENT:
        if(auto end = tokenizer.matchIdentifier(start, reads)) {
            result = finishToken(state, start, "Identifier", std::string{ tokenizer.getSlice(start.offset, end->offset) }, *end, std::move(reads));
        }
        break;
    case TokenKind::NEWLINE:
        if(auto end = tokenizer.matchNewline(start, reads)) {
            result = MatchResult::empty(*end);
        }
        break;
    case TokenKind::END_OF_INPUT: {
        auto end = tokenizer.skipWhitespaces(start, reads);
        if(tokenizer.isEmpty(end)) {
            result = MatchResult::empty(end);
        }
        break;
    }
    case TokenKind::INDENT:
    case TokenKind::DEDENT:
        PEG_LOG_DEBUG("Token ", tokenKindToString(kind), " is reserved and never matches");
        break;
    }
    if(!result.single) {
        result.reads = std::move(reads);
    }
    auto& stored = memoize(key, std::move(result));
    consumeResult(stored);
    return stored;
}

MatchResult PegInterpreter::finishToken(ParsingState state, ParsingState start, const char* nodeType, SourceValue value, ParsingState end, ReadSet reads) {
    auto [line, column] = mTokenizer->getPosition(start);
    auto nodeId = addNode(SourceNode{
        .type = nodeType,
        .value = std::move(value),
        .line = line,
        .column = column,
        .start = start.offset,
        .end = end.offset,
        .invokeOffset = state.offset,
        .depth = currentDepth() + 1,
        .reads = std::move(reads) });
    return MatchResult::value(end, MatchFragment{ .node = nodeId, .offset = start.offset });
}

ParsingState PegInterpreter::skipIgnored(ParsingState state) {
    if(!mGrammar->getSkipWhitespace()) {
        return state;
    }
    return mTokenizer->skipIgnored(state, mGrammar->getCommentPatterns(), getCurrentReads());
}

const MatchResult& PegInterpreter::memoize(MemoKey key, MatchResult result) {
    return mMemo.insert_or_assign(key, std::move(result)).first->second;
}

void PegInterpreter::consumeResult(const MatchResult& result) {
    auto& frame = mFrames.back();
    frame.reads.merge(result.reads);
    result.forEachNode([&](NodeId node) {
        frame.touched.push_back(node);
    });
}

void PegInterpreter::chargeDiscarded(Frame& frame, const MatchResult& kept) const {
    std::unordered_set<NodeId> keptNodes;
    kept.forEachNode([&](NodeId node) {
        keptNodes.insert(node);
    });
    for(auto node : frame.touched) {
        if(keptNodes.count(node) == 0) {
            collectSubtreeReads(node, frame.reads);
        }
    }
}

void PegInterpreter::collectSubtreeReads(NodeId id, ReadSet& reads) const {
    const auto& node = mNodes.at(id);
    reads.merge(node.reads);
    for(auto child : node.children) {
        collectSubtreeReads(child, reads);
    }
}

NodeId PegInterpreter::addNode(SourceNode node) {
    mNodes.emplace_back(std::move(node));
    return static_cast<NodeId>(mNodes.size() - 1);
}

void PegInterpreter::fillNode(NodeId id, const MatchResult& match) {
    if(match.single) {
        if(match.single->isNode()) {
            mNodes.at(id).children.push_back(match.single->node);
        } else {
            mNodes.at(id).value = match.single->text;
        }
        return;
    }
    std::vector<NodeId> children;
    auto depth = mNodes.at(id).depth;
    for(auto& fragment : match.fragments) {
        if(fragment.isNode()) {
            children.push_back(fragment.node);
            continue;
        }
        if(isBlank(fragment.text))
            continue;
        auto [line, column] = mTokenizer->getPosition(ParsingState{ fragment.offset });
        children.push_back(addNode(SourceNode{
            .type = "Operator",
            .value = fragment.text,
            .line = line,
            .column = column,
            .start = fragment.offset,
            .end = fragment.offset + fragment.text.size(),
            .invokeOffset = fragment.offset,
            .depth = depth + 1 }));
    }
    mNodes.at(id).children = std::move(children);
}

void PegInterpreter::noteAttempt(std::string_view name, ParsingState state) {
    if(state.offset > mFurthestOffset || mFurthestRule.empty()) {
        mFurthestOffset = state.offset;
        mFurthestRule = name;
    }
}

size_t PegInterpreter::currentDepth() const {
    return mFrames.size() - 1 + mDepthOffset;
}

void PegInterpreter::throwParseError() const {
    auto [line, column] = mTokenizer->getPosition(ParsingState{ mFurthestOffset });
    auto snippet = std::string{ mTokenizer->getSlice(mFurthestOffset, mFurthestOffset + 30) };
    snippet = snippet.substr(0, snippet.find('\n'));
    throw SyntaxError{ "Parse error at line " + std::to_string(line) + ", column " + std::to_string(column) + " (in rule '" + mFurthestRule + "'): unexpected '" + snippet + "'",
        mFurthestOffset, line, column, mFurthestRule, snippet };
}

SourceTree PegInterpreter::buildTree(NodeId root, ReadSet documentReads, std::string source) const {
    std::vector<SourceNode> nodes;
    copyReachable(root, INVALID_NODE, nodes);
    return SourceTree{ std::move(source), std::move(nodes), 0, std::move(documentReads) };
}

NodeId PegInterpreter::copyReachable(NodeId id, NodeId parent, std::vector<SourceNode>& nodes) const {
    const auto& original = mNodes.at(id);
    auto newId = static_cast<NodeId>(nodes.size());
    nodes.push_back(original);
    nodes.back().parent = parent;
    nodes.back().children.clear();
    for(auto& [start, end] : original.reads.getIntervals()) {
        nodes.back().extendReadExtent(start, end);
    }
    for(auto child : original.children) {
        auto newChild = copyReachable(child, newId, nodes);
        auto& copy = nodes.at(newId);
        copy.children.push_back(newChild);
        copy.extendReadExtent(nodes.at(newChild).readStart, nodes.at(newChild).readEnd);
    }
    return newId;
}

}
