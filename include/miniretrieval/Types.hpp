#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace miniretrieval {

using Term = std::string;
using DocId = uint32_t;
using Position = uint32_t;

using PostingList = std::vector<DocId>;
using GapSequence = std::vector<uint32_t>;
using PositionList = std::vector<Position>;

struct PositionalPosting {
    DocId doc;
    PositionList positions;
};

using PositionalPostingList = std::vector<PositionalPosting>;

// Builder input: ordered by DocId, so iteration is ascending.
using DocumentTerms = std::map<DocId, std::vector<Term>>;

inline bool operator==(const PositionalPosting& a, const PositionalPosting& b) {
    return a.doc == b.doc && a.positions == b.positions;
}

inline bool operator!=(const PositionalPosting& a, const PositionalPosting& b) {
    return !(a == b);
}

} // namespace miniretrieval
