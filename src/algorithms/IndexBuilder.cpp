#include "miniretrieval/algorithms/IndexBuilder.hpp"

#include <algorithm>

namespace miniretrieval::algo {

namespace {
const PostingList kEmptyPostings;
const PositionalPostingList kEmptyPositionalPostings;

template <typename Map>
std::vector<Term> sortedKeys(const Map& map) {
    std::vector<Term> keys;
    keys.reserve(map.size());
    for (const auto& kv : map) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}
} // namespace

// -----------------------------------------------------------
// InvertedIndex
// -----------------------------------------------------------
InvertedIndex InvertedIndex::build(const DocumentTerms& documents) {
    InvertedIndex result;
    for (const auto& [doc, terms] : documents) {
        for (const auto& term : terms) {
            auto& vec = result.index_[term];
            // Only the last element can equal doc since docs arrive ascending
            if (vec.empty() || vec.back() != doc) {
                vec.push_back(doc);
            }
        }
    }
    return result;
}

const PostingList& InvertedIndex::postings(const Term& term) const {
    auto it = index_.find(term);
    return it == index_.end() ? kEmptyPostings : it->second;
}

std::vector<Term> InvertedIndex::terms() const {
    return sortedKeys(index_);
}

// -----------------------------------------------------------
// PositionalIndex
// -----------------------------------------------------------
PositionalIndex PositionalIndex::build(const DocumentTerms& documents) {
    PositionalIndex result;
    for (const auto& [doc, terms] : documents) {
        for (size_t pos = 0; pos < terms.size(); ++pos) {
            auto& plist = result.index_[terms[pos]];
            if (plist.empty() || plist.back().doc != doc) {
                plist.push_back(PositionalPosting{doc, {static_cast<Position>(pos)}});
            } else {
                plist.back().positions.push_back(static_cast<Position>(pos));
            }
        }
    }
    return result;
}

const PositionalPostingList& PositionalIndex::postings(const Term& term) const {
    auto it = index_.find(term);
    return it == index_.end() ? kEmptyPositionalPostings : it->second;
}

std::vector<Term> PositionalIndex::terms() const {
    return sortedKeys(index_);
}

InvertedIndex PositionalIndex::toInvertedIndex() const {
    InvertedIndex result;
    result.index_.reserve(index_.size());
    for (const auto& [term, plist] : index_) {
        auto& ids = result.index_[term];
        ids.reserve(plist.size());
        for (const auto& p : plist) ids.push_back(p.doc);
    }
    return result;
}

} // namespace miniretrieval::algo
