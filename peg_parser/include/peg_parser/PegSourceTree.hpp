#pragma once

#include "peg_parser/PegForward.hpp"
#include "peg_parser/PegStructs.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peg {

struct SourceNode {
    std::string type;
    SourceValue value;
    std::vector<NodeId> children;
    NodeId parent = INVALID_NODE;
    // 1-based
    size_t line = 1, column = 1;
    // matched span [start, end)
    size_t start = 0, end = 0;
    // offset the producing rule was invoked at, before skipping whitespace and comments
    size_t invokeOffset = 0;
    // unset for tokens and Operator leaves
    std::optional<RuleId> rule;
    // number of enclosing rule invocations
    size_t depth = 0;
    // offsets examined while producing this node, excluding those of its children
    ReadSet reads;
    // [readStart, readEnd) covers the reads of the whole subtree; empty if nothing was read
    size_t readStart = 0, readEnd = 0;

    void extendReadExtent(size_t from, size_t to) {
        if(from >= to)
            return;
        if(readStart >= readEnd) {
            readStart = from;
            readEnd = to;
            return;
        }
        readStart = std::min(readStart, from);
        readEnd = std::max(readEnd, to);
    }
    [[nodiscard]] bool readExtentIntersects(size_t from, size_t to) const {
        return readStart < readEnd && readStart < to && from < readEnd;
    }
};

// Parse tree stored as an arena of nodes addressed by NodeId, together with the
// text it was parsed from. Ids stay valid while the tree is patched.
//
// Patching only touches the replaced subtree and its ancestors. The offset shift
// for everything else is logged and applied to a node when it is next accessed
// through getNode(), so offsets and positions read through it are always current.
class SourceTree final {
public:
    SourceTree(std::string source, std::vector<SourceNode> nodes, NodeId root, ReadSet documentReads);

    [[nodiscard]] NodeId getRoot() const {
        return mRoot;
    }
    [[nodiscard]] const SourceNode& getNode(NodeId id) const {
        catchUp(id);
        return mNodes.at(id);
    }
    [[nodiscard]] const SourceNode& operator[](NodeId id) const {
        return getNode(id);
    }
    [[nodiscard]] const std::string& getSource() const {
        return mSource;
    }
    [[nodiscard]] std::string_view getSourceText(NodeId id) const;
    // Offsets examined outside of any node, e.g. by the check for trailing input.
    [[nodiscard]] const ReadSet& getDocumentReads() const {
        return mDocumentReads;
    }
    [[nodiscard]] size_t size() const {
        return mNodes.size() - mFreeSlots.size();
    }

    [[nodiscard]] std::vector<NodeId> preorder() const;
    [[nodiscard]] std::vector<NodeId> findAll(std::string_view type) const;
    [[nodiscard]] std::optional<NodeId> findFirst(std::string_view type) const;
    [[nodiscard]] NodeId findCommonAncestor(NodeId a, NodeId b) const;
    [[nodiscard]] bool isAncestorOf(NodeId ancestor, NodeId node) const;
    // Nodes whose own reads intersect [start, end). Subtrees whose read extent
    // misses the range are skipped.
    [[nodiscard]] std::vector<NodeId> findReaders(size_t start, size_t end) const;

    // {type, value, children, line, column} for every node
    [[nodiscard]] nlohmann::ordered_json toJson() const;
    [[nodiscard]] nlohmann::ordered_json toJson(NodeId id) const;
    // One node per line, children indented by two spaces.
    [[nodiscard]] std::string dump() const;
    [[nodiscard]] std::string dumpNode(NodeId id) const;

    // Applies edit to the text and replaces the subtree at target with the root of
    // replacement, which was parsed from the edited text. The ancestors of target
    // grow by the edit's delta, nodes behind the edit move by it.
    void replaceSubtree(NodeId target, const SourceTree& replacement, const SourceEdit& edit);

private:
    struct Shift {
        size_t editStart = 0, editEnd = 0;
        ptrdiff_t delta = 0;
    };

    NodeId copyFrom(const SourceTree& other, NodeId otherId, NodeId parent, std::optional<NodeId> slot);
    void releaseDescendants(NodeId id);
    // Applies the shifts logged since the node was last touched.
    void catchUp(NodeId id) const;
    void compact();
    [[nodiscard]] size_t getVersion() const {
        return mShiftBase + mPendingShifts.size();
    }

    std::string mSource;
    LineTable mLines;
    mutable std::vector<SourceNode> mNodes;
    // number of shifts each node has seen
    mutable std::vector<size_t> mVersions;
    std::vector<NodeId> mFreeSlots;
    NodeId mRoot;
    ReadSet mDocumentReads;
    std::vector<Shift> mPendingShifts;
    // shifts every node has seen
    size_t mShiftBase = 0;
};

}
