#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "miniretrieval/Types.hpp"

namespace miniretrieval::algo {

class PositionalIndex;

// Term -> ascending, duplicate-free DocIds. Built once, read-only afterwards.
class InvertedIndex {
public:
    // Single linear pass over the documents in ascending DocId order.
    static InvertedIndex build(const DocumentTerms& documents);

    // Absent terms yield an empty list.
    const PostingList& postings(const Term& term) const;

    bool contains(const Term& term) const { return index_.count(term) != 0; }
    std::size_t termCount() const { return index_.size(); }

    // Vocabulary in lexicographic order.
    std::vector<Term> terms() const;

private:
    friend class PositionalIndex;
    std::unordered_map<Term, PostingList> index_;
};

// Term -> (DocId, positions) pairs, ascending by DocId.
class PositionalIndex {
public:
    static PositionalIndex build(const DocumentTerms& documents);

    const PositionalPostingList& postings(const Term& term) const;

    bool contains(const Term& term) const { return index_.count(term) != 0; }
    std::size_t termCount() const { return index_.size(); }
    std::vector<Term> terms() const;

    // Same documents per term, positions dropped.
    InvertedIndex toInvertedIndex() const;

private:
    std::unordered_map<Term, PositionalPostingList> index_;
};

} // namespace miniretrieval::algo
