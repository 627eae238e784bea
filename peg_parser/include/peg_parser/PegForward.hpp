#pragma once

#include <cstdint>
#include <limits>

namespace peg {

class ParsingExpression;
class PegTokenizer;
class PegInterpreter;
class IncrementalParser;
class Grammar;
class SourceTree;
class ReadSet;
struct NamedRule;
struct SourceNode;
struct MatchResult;

using RuleId = uint32_t;
using NodeId = uint32_t;

constexpr NodeId INVALID_NODE = std::numeric_limits<NodeId>::max();

}
