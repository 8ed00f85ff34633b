#include "miniretrieval/algorithms/Proximity.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <optional>

namespace miniretrieval::algo {

namespace {

using Matcher = std::function<PositionList(const PositionList&, const PositionList&)>;

// Merge-join by DocId, applying `match` to each shared document.
Sequence<ProximityMatch> joinDocuments(const PositionalPostingList& first,
                                       const PositionalPostingList& second,
                                       Matcher match) {
    return Sequence<ProximityMatch>(
        [&first, &second, match = std::move(match), i = size_t{0}, j = size_t{0}]() mutable
        -> std::optional<ProximityMatch> {
            while (i < first.size() && j < second.size()) {
                const auto& a = first[i];
                const auto& b = second[j];
                if (a.doc == b.doc) {
                    ++i;
                    ++j;
                    auto positions = match(a.positions, b.positions);
                    if (!positions.empty()) {
                        return ProximityMatch{a.doc, std::move(positions)};
                    }
                } else if (a.doc < b.doc) {
                    ++i;
                } else {
                    ++j;
                }
            }
            return std::nullopt;
        });
}

} // namespace

PositionList matchPositions(const PositionList& first, const PositionList& second, uint32_t proximity) {
    PositionList out;
    std::deque<Position> window;
    size_t j = 0;
    for (Position p1 : first) {
        const uint64_t upper = static_cast<uint64_t>(p1) + proximity;
        // Admit everything from the second list that is not beyond p1 + proximity
        while (j < second.size() && second[j] <= upper) {
            window.push_back(second[j]);
            ++j;
        }
        // Evict from the front anything that fell more than proximity behind p1
        while (!window.empty() && static_cast<uint64_t>(window.front()) + proximity < p1) {
            window.pop_front();
        }
        if (!window.empty()) {
            out.push_back(p1);
        }
    }
    return out;
}

Sequence<ProximityMatch> proximityIntersect(const PositionalPostingList& first,
                                            const PositionalPostingList& second,
                                            uint32_t proximity) {
    return joinDocuments(first, second, [proximity](const PositionList& a, const PositionList& b) {
        return matchPositions(a, b, proximity);
    });
}

Sequence<ProximityMatch> phraseIntersect(const PositionalPostingList& first,
                                         const PositionalPostingList& second) {
    return joinDocuments(first, second, [](const PositionList& a, const PositionList& b) {
        PositionList out;
        size_t j = 0;
        for (Position p1 : a) {
            const uint64_t want = static_cast<uint64_t>(p1) + 1;
            while (j < b.size() && b[j] < want) ++j;
            if (j == b.size()) break;
            if (b[j] == want) out.push_back(p1);
        }
        return out;
    });
}

Sequence<ProximityMatch> queryProximity(const PositionalIndex& index,
                                        const Term& first,
                                        const Term& second,
                                        uint32_t proximity) {
    return proximityIntersect(index.postings(first), index.postings(second), proximity);
}

} // namespace miniretrieval::algo
