#pragma once

#include <map>
#include "miniretrieval/Types.hpp"

namespace miniretrieval::algo {

class InvertedIndex;

// Delta-encodes a strictly ascending list; the first gap is the first value.
// Throws std::invalid_argument if the input is not strictly ascending.
GapSequence valuesToGaps(const PostingList& values);

// Running sum of gaps. Throws std::invalid_argument on a zero gap past the
// first element or on overflow.
PostingList gapsToValues(const GapSequence& gaps);

std::map<Term, GapSequence> buildGappedPostings(const InvertedIndex& index);

} // namespace miniretrieval::algo
