#include "peg_parser/PegStructs.hpp"
#include <algorithm>

namespace peg {

void ReadSet::add(size_t start, size_t end) {
    if(start >= end)
        return;
    if(mIntervals.empty() || mIntervals.back().second < start) {
        mIntervals.emplace_back(start, end);
        return;
    }
    auto it = std::lower_bound(mIntervals.begin(), mIntervals.end(), start, [](const std::pair<size_t, size_t>& interval, size_t value) {
        return interval.second < value;
    });
    if(it == mIntervals.end() || it->first > end) {
        mIntervals.insert(it, std::make_pair(start, end));
        return;
    }
    it->first = std::min(it->first, start);
    it->second = std::max(it->second, end);
    auto next = std::next(it);
    while(next != mIntervals.end() && next->first <= it->second) {
        it->second = std::max(it->second, next->second);
        next = mIntervals.erase(next);
        it = std::prev(next);
    }
}

void ReadSet::merge(const ReadSet& other) {
    if(mIntervals.empty()) {
        mIntervals = other.mIntervals;
        return;
    }
    for(auto& [start, end] : other.mIntervals) {
        add(start, end);
    }
}

bool ReadSet::intersects(size_t start, size_t end) const {
    if(start >= end)
        return false;
    auto it = std::upper_bound(mIntervals.begin(), mIntervals.end(), start, [](size_t value, const std::pair<size_t, size_t>& interval) {
        return value < interval.second;
    });
    return it != mIntervals.end() && it->first < end;
}

void ReadSet::shift(size_t editStart, size_t editEnd, ptrdiff_t delta) {
    for(auto& interval : mIntervals) {
        if(isBehindEdit(interval.first, editStart, editEnd)) {
            interval.first += delta;
            interval.second += delta;
        }
    }
}

LineTable::LineTable(std::string_view source) {
    mLineStarts.push_back(0);
    for(size_t i = 0; i < source.size(); ++i) {
        if(source[i] == '\n') {
            mLineStarts.push_back(i + 1);
        }
    }
}

std::pair<size_t, size_t> LineTable::getPosition(size_t offset) const {
    auto it = std::upper_bound(mLineStarts.cbegin(), mLineStarts.cend(), offset);
    auto lineIndex = static_cast<size_t>(std::distance(mLineStarts.cbegin(), it)) - 1;
    return std::make_pair(lineIndex + 1, offset - mLineStarts.at(lineIndex) + 1);
}

void LineTable::applyEdit(size_t offset, size_t oldLength, std::string_view newText) {
    // line starts follow a '\n', so the removed ones lie in (offset, offset + oldLength]
    auto first = std::upper_bound(mLineStarts.begin(), mLineStarts.end(), offset);
    auto last = std::upper_bound(first, mLineStarts.end(), offset + oldLength);
    auto delta = static_cast<ptrdiff_t>(newText.size()) - static_cast<ptrdiff_t>(oldLength);
    for(auto it = last; it != mLineStarts.end(); ++it) {
        *it += delta;
    }
    std::vector<size_t> inserted;
    for(size_t i = 0; i < newText.size(); ++i) {
        if(newText[i] == '\n') {
            inserted.push_back(offset + i + 1);
        }
    }
    first = mLineStarts.erase(first, last);
    mLineStarts.insert(first, inserted.begin(), inserted.end());
}

void MatchResult::append(MatchResult&& other) {
    if(other.single) {
        fragments.emplace_back(std::move(*other.single));
    }
    for(auto& fragment : other.fragments) {
        fragments.emplace_back(std::move(fragment));
    }
}

}
