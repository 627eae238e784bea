#pragma once
#include "peg_parser/PegForward.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace peg {

struct ParsingState {
    size_t offset = 0;
    inline bool operator==(const ParsingState& pOther) const {
        return offset == pOther.offset;
    }
};

// Scalar payload of a tree node: none, integer, float or string.
using SourceValue = std::variant<std::monostate, int64_t, double, std::string>;

// Set of source offsets that were examined while matching, stored as sorted,
// disjoint half-open intervals. The offset one past the last character stands
// for the end of input.
class ReadSet final {
public:
    void add(size_t start, size_t end);
    void merge(const ReadSet& other);
    [[nodiscard]] bool intersects(size_t start, size_t end) const;
    // Moves every interval lying behind an edit of [editStart, editEnd) by delta.
    // Intervals must not intersect the edited range.
    void shift(size_t editStart, size_t editEnd, ptrdiff_t delta);
    [[nodiscard]] bool empty() const {
        return mIntervals.empty();
    }
    void clear() {
        mIntervals.clear();
    }
    [[nodiscard]] const std::vector<std::pair<size_t, size_t>>& getIntervals() const {
        return mIntervals;
    }

private:
    std::vector<std::pair<size_t, size_t>> mIntervals;
};

// Whether an offset lies behind an edit of [editStart, editEnd) and therefore moves with it.
[[nodiscard]] inline bool isBehindEdit(size_t offset, size_t editStart, size_t editEnd) {
    return offset > editStart && offset >= editEnd;
}

// Replaces [offset, offset + oldLength) with newText.
struct SourceEdit {
    size_t offset = 0;
    size_t oldLength = 0;
    std::string newText;

    [[nodiscard]] ptrdiff_t delta() const {
        return static_cast<ptrdiff_t>(newText.size()) - static_cast<ptrdiff_t>(oldLength);
    }
    [[nodiscard]] size_t newLength() const {
        return newText.size();
    }
};

class LineTable final {
public:
    explicit LineTable(std::string_view source);
    // 1-based (line, column)
    [[nodiscard]] std::pair<size_t, size_t> getPosition(size_t offset) const;
    // Keeps the table in step with text where [offset, offset + oldLength) became newText.
    void applyEdit(size_t offset, size_t oldLength, std::string_view newText);
    [[nodiscard]] size_t getLineCount() const {
        return mLineStarts.size();
    }

private:
    std::vector<size_t> mLineStarts;
};

// One piece of a match: either a finished node or raw matched text.
struct MatchFragment {
    NodeId node = INVALID_NODE;
    std::string text;
    size_t offset = 0;

    [[nodiscard]] inline bool isNode() const {
        return node != INVALID_NODE;
    }
};

struct MatchResult {
    bool success = false;
    ParsingState state;
    // Set when the match produced exactly one value on its own (a rule, token, literal or class).
    std::optional<MatchFragment> single;
    // Values collected by sequences and repetitions.
    std::vector<MatchFragment> fragments;
    // Offsets examined on behalf of whoever consumes this result.
    ReadSet reads;

    static MatchResult failure(ParsingState state) {
        return MatchResult{ .success = false, .state = state };
    }
    static MatchResult empty(ParsingState state) {
        return MatchResult{ .success = true, .state = state };
    }
    static MatchResult value(ParsingState state, MatchFragment fragment) {
        return MatchResult{ .success = true, .state = state, .single = std::move(fragment) };
    }
    // Appends the values of another result in the order they were matched.
    void append(MatchResult&& other);
    template<typename Callback>
    void forEachNode(Callback&& callback) const {
        if(single && single->isNode())
            callback(single->node);
        for(auto& fragment : fragments) {
            if(fragment.isNode())
                callback(fragment.node);
        }
    }
};

}
