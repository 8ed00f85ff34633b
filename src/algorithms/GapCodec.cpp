#include "miniretrieval/algorithms/GapCodec.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include "miniretrieval/algorithms/IndexBuilder.hpp"

namespace miniretrieval::algo {

GapSequence valuesToGaps(const PostingList& values) {
    GapSequence gaps;
    gaps.reserve(values.size());
    DocId offset = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0 && values[i] <= offset) {
            throw std::invalid_argument("valuesToGaps: input not strictly ascending at index " +
                                        std::to_string(i));
        }
        gaps.push_back(values[i] - offset);
        offset = values[i];
    }
    return gaps;
}

PostingList gapsToValues(const GapSequence& gaps) {
    PostingList values;
    values.reserve(gaps.size());
    uint64_t offset = 0;
    for (size_t i = 0; i < gaps.size(); ++i) {
        if (i > 0 && gaps[i] == 0) {
            throw std::invalid_argument("gapsToValues: zero gap at index " + std::to_string(i));
        }
        offset += gaps[i];
        if (offset > std::numeric_limits<DocId>::max()) {
            throw std::invalid_argument("gapsToValues: value overflow at index " + std::to_string(i));
        }
        values.push_back(static_cast<DocId>(offset));
    }
    return values;
}

std::map<Term, GapSequence> buildGappedPostings(const InvertedIndex& index) {
    std::map<Term, GapSequence> result;
    for (const auto& term : index.terms()) {
        result.emplace(term, valuesToGaps(index.postings(term)));
    }
    return result;
}

} // namespace miniretrieval::algo
