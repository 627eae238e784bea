#pragma once

#include "peg_parser/PegInterpreter.hpp"
#include "peg_parser/PegSourceTree.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peg {

struct IncrementalStats {
    // calls to parse() and applyEdit()
    size_t totalParses = 0;
    size_t incrementalCount = 0;
    size_t fullReparseCount = 0;
    std::chrono::nanoseconds lastDuration{ 0 };

    [[nodiscard]] double getLastParseMs() const {
        return static_cast<double>(lastDuration.count()) / 1e6;
    }
};

// A rule node of the live tree that can be re-parsed on its own. Regions are
// derived from the tree on request and never steer a patch.
struct Region {
    size_t start = 0, end = 0;
    NodeId node = INVALID_NODE;
    RuleId rule = 0;
};

// Keeps one document and its tree up to date while it is being edited. Edits are
// patched into the smallest enclosing rule node whose result can be recomputed in
// isolation, otherwise the document is parsed again. The tree after an edit is
// always the tree a full parse of the new text would produce.
class IncrementalParser final {
public:
    explicit IncrementalParser(sp<const Grammar> grammar, InterpreterOptions options = {});

    // Throws on syntax errors.
    const SourceTree& parse(std::string source);
    // Never throws a ParseException or GrammarError. If the new text doesn't parse,
    // the previous tree is kept.
    const std::optional<SourceTree>& applyEdit(size_t offset, size_t oldLength, std::string_view newText);
    const std::optional<SourceTree>& applyEdit(const SourceEdit& edit);
    // Applied from the highest offset down so that earlier offsets stay valid.
    const std::optional<SourceTree>& applyEdits(std::vector<SourceEdit> edits);

    [[nodiscard]] const IncrementalStats& getStats() const {
        return mStats;
    }
    void invalidate();
    void reset();

    [[nodiscard]] const std::optional<SourceTree>& getTree() const {
        return mTree;
    }
    [[nodiscard]] const std::string& getSource() const {
        return mSource;
    }
    // Every rule node below the root in document order. Empty while edits can't be patched.
    [[nodiscard]] const std::vector<Region>& getRegions() const;
    // Set when the last edit left text the grammar rejects; the tree then belongs to older text.
    [[nodiscard]] bool isStale() const {
        return mStale;
    }

private:
    bool tryPatch(const SourceEdit& edit);
    void fullParse();
    void setPatchable(bool patchable);

    PegInterpreter mInterpreter;
    std::string mSource;
    std::optional<SourceTree> mTree;
    // the tree matches mSource and the interpreter still holds its text
    bool mPatchable = false;
    mutable std::vector<Region> mRegions;
    mutable bool mRegionsCurrent = false;
    bool mStale = false;
    IncrementalStats mStats;
};

}
