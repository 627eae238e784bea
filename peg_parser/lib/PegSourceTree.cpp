#include "peg_parser/PegSourceTree.hpp"
#include <sstream>
#include <tuple>
#include <unordered_set>

namespace peg {

static nlohmann::ordered_json valueToJson(const SourceValue& value) {
    switch(value.index()) {
    case 1:
        return std::get<int64_t>(value);
    case 2:
        return std::get<double>(value);
    case 3:
        return std::get<std::string>(value);
    default:
        return nullptr;
    }
}

static std::string valueToString(const SourceValue& value) {
    std::stringstream ss;
    switch(value.index()) {
    case 1:
        ss << std::get<int64_t>(value);
        break;
    case 2:
        ss << std::get<double>(value);
        break;
    case 3:
        ss << "'" << std::get<std::string>(value) << "'";
        break;
    default:
        break;
    }
    return ss.str();
}

static constexpr size_t MAX_PENDING_SHIFTS = 64;

static size_t shiftOffset(size_t offset, size_t editStart, size_t editEnd, ptrdiff_t delta) {
    if(!isBehindEdit(offset, editStart, editEnd))
        return offset;
    return static_cast<size_t>(static_cast<ptrdiff_t>(offset) + delta);
}

SourceTree::SourceTree(std::string source, std::vector<SourceNode> nodes, NodeId root, ReadSet documentReads)
: mSource(std::move(source)), mLines(mSource), mNodes(std::move(nodes)), mVersions(mNodes.size(), 0), mRoot(root), mDocumentReads(std::move(documentReads)) {
}

void SourceTree::catchUp(NodeId id) const {
    auto& version = mVersions.at(id);
    if(version == getVersion())
        return;
    auto& node = mNodes.at(id);
    auto oldStart = node.start;
    for(auto i = version - mShiftBase; i < mPendingShifts.size(); ++i) {
        auto& shift = mPendingShifts[i];
        node.start = shiftOffset(node.start, shift.editStart, shift.editEnd, shift.delta);
        node.end = shiftOffset(node.end, shift.editStart, shift.editEnd, shift.delta);
        node.invokeOffset = shiftOffset(node.invokeOffset, shift.editStart, shift.editEnd, shift.delta);
        node.readStart = shiftOffset(node.readStart, shift.editStart, shift.editEnd, shift.delta);
        node.readEnd = shiftOffset(node.readEnd, shift.editStart, shift.editEnd, shift.delta);
        node.reads.shift(shift.editStart, shift.editEnd, shift.delta);
    }
    // text in front of an unmoved node is unchanged
    if(node.start != oldStart) {
        std::tie(node.line, node.column) = mLines.getPosition(node.start);
    }
    version = getVersion();
}

void SourceTree::compact() {
    for(NodeId id = 0; id < mNodes.size(); ++id) {
        catchUp(id);
    }
    mShiftBase = getVersion();
    mPendingShifts.clear();
}

std::string_view SourceTree::getSourceText(NodeId id) const {
    const auto& node = getNode(id);
    return std::string_view{ mSource }.substr(node.start, node.end - node.start);
}

std::vector<NodeId> SourceTree::preorder() const {
    std::vector<NodeId> ret;
    std::vector<NodeId> stack{ mRoot };
    while(!stack.empty()) {
        auto id = stack.back();
        stack.pop_back();
        ret.push_back(id);
        const auto& children = mNodes.at(id).children;
        for(auto it = children.crbegin(); it != children.crend(); ++it) {
            stack.push_back(*it);
        }
    }
    return ret;
}

std::vector<NodeId> SourceTree::findAll(std::string_view type) const {
    std::vector<NodeId> ret;
    for(auto id : preorder()) {
        if(mNodes.at(id).type == type)
            ret.push_back(id);
    }
    return ret;
}

std::optional<NodeId> SourceTree::findFirst(std::string_view type) const {
    for(auto id : preorder()) {
        if(mNodes.at(id).type == type)
            return id;
    }
    return {};
}

bool SourceTree::isAncestorOf(NodeId ancestor, NodeId node) const {
    for(auto current = node; current != INVALID_NODE; current = mNodes.at(current).parent) {
        if(current == ancestor)
            return true;
    }
    return false;
}

NodeId SourceTree::findCommonAncestor(NodeId a, NodeId b) const {
    std::unordered_set<NodeId> ancestorsOfA;
    for(auto current = a; current != INVALID_NODE; current = mNodes.at(current).parent) {
        ancestorsOfA.insert(current);
    }
    for(auto current = b; current != INVALID_NODE; current = mNodes.at(current).parent) {
        if(ancestorsOfA.count(current) > 0)
            return current;
    }
    return mRoot;
}

nlohmann::ordered_json SourceTree::toJson() const {
    return toJson(mRoot);
}

std::vector<NodeId> SourceTree::findReaders(size_t start, size_t end) const {
    std::vector<NodeId> ret;
    std::vector<NodeId> stack{ mRoot };
    while(!stack.empty()) {
        auto id = stack.back();
        stack.pop_back();
        const auto& node = getNode(id);
        if(!node.readExtentIntersects(start, end))
            continue;
        if(node.reads.intersects(start, end))
            ret.push_back(id);
        for(auto it = node.children.crbegin(); it != node.children.crend(); ++it) {
            stack.push_back(*it);
        }
    }
    return ret;
}

nlohmann::ordered_json SourceTree::toJson(NodeId id) const {
    const auto& node = getNode(id);
    auto children = nlohmann::ordered_json::array();
    for(auto child : node.children) {
        children.push_back(toJson(child));
    }
    nlohmann::ordered_json ret;
    ret["type"] = node.type;
    ret["value"] = valueToJson(node.value);
    ret["children"] = std::move(children);
    ret["line"] = node.line;
    ret["column"] = node.column;
    return ret;
}

std::string SourceTree::dumpNode(NodeId id) const {
    const auto& node = mNodes.at(id);
    if(node.value.index() != 0) {
        return node.type + "(" + valueToString(node.value) + ")";
    }
    if(!node.children.empty()) {
        return node.type + "[" + std::to_string(node.children.size()) + "]";
    }
    return node.type;
}

std::string SourceTree::dump() const {
    std::string ret;
    std::vector<std::pair<NodeId, size_t>> stack{ { mRoot, 0 } };
    while(!stack.empty()) {
        auto [id, indent] = stack.back();
        stack.pop_back();
        if(!ret.empty()) {
            ret += "\n";
        }
        ret += std::string(indent * 2, ' ') + dumpNode(id);
        const auto& children = mNodes.at(id).children;
        for(auto it = children.crbegin(); it != children.crend(); ++it) {
            stack.emplace_back(*it, indent + 1);
        }
    }
    return ret;
}

void SourceTree::releaseDescendants(NodeId id) {
    for(auto child : mNodes.at(id).children) {
        releaseDescendants(child);
        mNodes.at(child) = SourceNode{};
        mVersions.at(child) = getVersion();
        mFreeSlots.push_back(child);
    }
}

NodeId SourceTree::copyFrom(const SourceTree& other, NodeId otherId, NodeId parent, std::optional<NodeId> slot) {
    NodeId id;
    if(slot) {
        id = *slot;
    } else if(!mFreeSlots.empty()) {
        id = mFreeSlots.back();
        mFreeSlots.pop_back();
    } else {
        id = static_cast<NodeId>(mNodes.size());
        mNodes.emplace_back();
        mVersions.push_back(0);
    }
    const auto& otherNode = other.getNode(otherId);
    SourceNode copy = otherNode;
    copy.parent = parent;
    copy.children.clear();
    mNodes.at(id) = std::move(copy);
    mVersions.at(id) = getVersion();
    for(auto otherChild : otherNode.children) {
        auto child = copyFrom(other, otherChild, id, {});
        mNodes.at(id).children.push_back(child);
    }
    return id;
}

void SourceTree::replaceSubtree(NodeId target, const SourceTree& replacement, const SourceEdit& edit) {
    Shift shift{ .editStart = edit.offset, .editEnd = edit.offset + edit.oldLength, .delta = edit.delta() };
    auto parent = mNodes.at(target).parent;
    std::vector<NodeId> ancestors;
    for(auto current = parent; current != INVALID_NODE; current = mNodes.at(current).parent) {
        catchUp(current);
        ancestors.push_back(current);
    }
    releaseDescendants(target);
    mSource.replace(edit.offset, edit.oldLength, edit.newText);
    mLines.applyEdit(edit.offset, edit.oldLength, edit.newText);
    mPendingShifts.push_back(shift);

    auto moved = [&](size_t offset) {
        return shiftOffset(offset, shift.editStart, shift.editEnd, shift.delta);
    };
    for(auto id : ancestors) {
        auto& node = mNodes.at(id);
        node.start = moved(node.start);
        node.end = static_cast<size_t>(static_cast<ptrdiff_t>(node.end) + shift.delta);
        node.invokeOffset = moved(node.invokeOffset);
        node.readStart = moved(node.readStart);
        node.readEnd = moved(node.readEnd);
        node.reads.shift(shift.editStart, shift.editEnd, shift.delta);
        std::tie(node.line, node.column) = mLines.getPosition(node.start);
        mVersions.at(id) = getVersion();
    }
    mDocumentReads.shift(shift.editStart, shift.editEnd, shift.delta);

    copyFrom(replacement, replacement.getRoot(), parent, target);
    auto readStart = mNodes.at(target).readStart;
    auto readEnd = mNodes.at(target).readEnd;
    for(auto id : ancestors) {
        mNodes.at(id).extendReadExtent(readStart, readEnd);
    }
    if(mPendingShifts.size() >= MAX_PENDING_SHIFTS) {
        compact();
    }
}

}
