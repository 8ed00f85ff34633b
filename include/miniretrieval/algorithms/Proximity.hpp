#pragma once

#include "miniretrieval/Types.hpp"
#include "miniretrieval/algorithms/IndexBuilder.hpp"
#include "miniretrieval/algorithms/Sequence.hpp"

namespace miniretrieval::algo {

struct ProximityMatch {
    DocId doc;
    PositionList positions; // positions from the first list that matched
};

inline bool operator==(const ProximityMatch& a, const ProximityMatch& b) {
    return a.doc == b.doc && a.positions == b.positions;
}

// Positions p1 of `first` with some p2 of `second` in the same document such
// that |p1 - p2| <= proximity. Documents without a match are skipped. Both
// lists must outlive the returned sequence.
Sequence<ProximityMatch> proximityIntersect(const PositionalPostingList& first,
                                            const PositionalPostingList& second,
                                            uint32_t proximity);

// Positions p1 of `first` where p1 + 1 occurs in `second` (ordered adjacency).
Sequence<ProximityMatch> phraseIntersect(const PositionalPostingList& first,
                                         const PositionalPostingList& second);

Sequence<ProximityMatch> queryProximity(const PositionalIndex& index,
                                        const Term& first,
                                        const Term& second,
                                        uint32_t proximity);

// Within-document matcher used by proximityIntersect; exposed for testing.
PositionList matchPositions(const PositionList& first, const PositionList& second, uint32_t proximity);

} // namespace miniretrieval::algo
