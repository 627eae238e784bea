#include "peg_parser/PegIncrementalParser.hpp"
#include "peg_parser/PegExceptions.hpp"
#include <algorithm>

namespace peg {

IncrementalParser::IncrementalParser(sp<const Grammar> grammar, InterpreterOptions options)
: mInterpreter(std::move(grammar), options) {
}

const SourceTree& IncrementalParser::parse(std::string source) {
    Stopwatch stopwatch;
    mStats.totalParses += 1;
    mSource = std::move(source);
    mStale = false;
    try {
        mTree = mInterpreter.parse(mSource);
    } catch(...) {
        mTree.reset();
        setPatchable(false);
        mStats.lastDuration = stopwatch.getElapsed();
        throw;
    }
    setPatchable(true);
    mStats.lastDuration = stopwatch.getElapsed();
    return *mTree;
}

const std::optional<SourceTree>& IncrementalParser::applyEdit(const SourceEdit& edit) {
    return applyEdit(edit.offset, edit.oldLength, edit.newText);
}

const std::optional<SourceTree>& IncrementalParser::applyEdit(size_t offset, size_t oldLength, std::string_view newText) {
    Stopwatch stopwatch;
    mStats.totalParses += 1;
    offset = std::min(offset, mSource.size());
    oldLength = std::min(oldLength, mSource.size() - offset);
    SourceEdit edit{ .offset = offset, .oldLength = oldLength, .newText = std::string{ newText } };
    mSource.replace(offset, oldLength, newText);

    bool patched = false;
    if(mTree && !mStale && mPatchable) {
        mInterpreter.editSource(offset, oldLength, newText);
        try {
            patched = tryPatch(edit);
        } catch(const ParseException& e) {
            PEG_LOG_DEBUG("Region re-parse failed: ", e.what());
        }
    }
    if(patched) {
        mStats.incrementalCount += 1;
        setPatchable(true);
    } else {
        mStats.fullReparseCount += 1;
        fullParse();
    }
    mStats.lastDuration = stopwatch.getElapsed();
    return mTree;
}

void IncrementalParser::fullParse() {
    try {
        mTree = mInterpreter.parse(mSource);
        mStale = false;
        setPatchable(true);
        return;
    } catch(const ParseException& e) {
        PEG_LOG_INFO("Keeping previous tree: ", e.what());
    } catch(const GrammarError& e) {
        PEG_LOG_ERROR("Keeping previous tree: ", e.what());
    }
    mStale = mTree.has_value();
    setPatchable(false);
}

const std::optional<SourceTree>& IncrementalParser::applyEdits(std::vector<SourceEdit> edits) {
    std::stable_sort(edits.begin(), edits.end(), [](const SourceEdit& a, const SourceEdit& b) {
        return a.offset > b.offset;
    });
    for(auto& edit : edits) {
        applyEdit(edit);
    }
    return mTree;
}

bool IncrementalParser::tryPatch(const SourceEdit& edit) {
    auto& tree = *mTree;
    auto editStart = edit.offset;
    auto editEnd = edit.offset + edit.oldLength;
    // an insertion still invalidates whoever looked at the character it lands on
    auto touchEnd = std::max(editEnd, editStart + 1);
    if(tree.getDocumentReads().intersects(editStart, touchEnd)) {
        return false;
    }
    std::optional<NodeId> affected;
    for(auto id : tree.findReaders(editStart, touchEnd)) {
        affected = affected ? tree.findCommonAncestor(*affected, id) : id;
    }
    if(!affected) {
        return false;
    }
    for(auto id = *affected; id != tree.getRoot(); id = tree[id].parent) {
        const auto& node = tree[id];
        if(!node.rule || node.invokeOffset > editStart || node.end < editEnd)
            continue;
        auto expectedEnd = static_cast<size_t>(static_cast<ptrdiff_t>(node.end) + edit.delta());
        auto region = mInterpreter.parseRegion(*node.rule, node.invokeOffset, expectedEnd, node.depth);
        if(!region)
            continue;
        PEG_LOG_DEBUG("Patched node ", id, " (", node.type, ") with ", region->size(), " nodes");
        tree.replaceSubtree(id, *region, edit);
        return true;
    }
    return false;
}

void IncrementalParser::setPatchable(bool patchable) {
    mPatchable = patchable;
    mRegions.clear();
    mRegionsCurrent = false;
}

const std::vector<Region>& IncrementalParser::getRegions() const {
    if(mRegionsCurrent || !mPatchable || !mTree)
        return mRegions;
    for(auto id : mTree->preorder()) {
        const auto& node = (*mTree)[id];
        if(id == mTree->getRoot() || !node.rule)
            continue;
        mRegions.push_back(Region{ .start = node.start, .end = node.end, .node = id, .rule = *node.rule });
    }
    mRegionsCurrent = true;
    return mRegions;
}

void IncrementalParser::invalidate() {
    setPatchable(false);
}

void IncrementalParser::reset() {
    mSource.clear();
    mTree.reset();
    setPatchable(false);
    mStale = false;
    mStats = IncrementalStats{};
}

}
