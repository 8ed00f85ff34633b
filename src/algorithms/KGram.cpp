#include "miniretrieval/algorithms/KGram.hpp"

#include <algorithm>
#include <stdexcept>
#include "miniretrieval/algorithms/Merge.hpp"

namespace miniretrieval::algo {

namespace {
const std::vector<Term> kNoCandidates;

void requireK(std::size_t k) {
    if (k == 0) throw std::invalid_argument("k-gram length must be at least 1");
}

// Sorted insert that keeps the list duplicate-free.
void insertSorted(std::vector<Term>& list, const Term& term) {
    auto it = std::lower_bound(list.begin(), list.end(), term);
    if (it == list.end() || *it != term) {
        list.insert(it, term);
    }
}
} // namespace

std::vector<std::string> kgrams(std::string_view term, std::size_t k) {
    requireK(k);
    std::string padded;
    padded.reserve(term.size() + 2);
    padded.push_back(kBoundary);
    padded.append(term.begin(), term.end());
    padded.push_back(kBoundary);

    std::vector<std::string> out;
    if (padded.size() < k) return out;
    out.reserve(padded.size() - k + 1);
    for (std::size_t i = 0; i + k <= padded.size(); ++i) {
        out.push_back(padded.substr(i, k));
    }
    return out;
}

bool wildcardMatch(std::string_view pattern, std::string_view term) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;
    while (t < term.size()) {
        if (p < pattern.size() && pattern[p] == kWildcard) {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == term[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            // Let the last star swallow one more character and retry
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == kWildcard) ++p;
    return p == pattern.size();
}

// -----------------------------------------------------------
// KGramIndex
// -----------------------------------------------------------
KGramIndex KGramIndex::build(const std::vector<Term>& vocabulary, std::size_t k) {
    requireK(k);
    KGramIndex result(k);
    for (const auto& term : vocabulary) {
        result.insert(term);
    }
    return result;
}

KGramIndex KGramIndex::build(const InvertedIndex& index, std::size_t k) {
    requireK(k);
    KGramIndex result(k);
    for (const auto& term : index.terms()) {
        // Terms carrying '$' or '*' stay searchable by exact match only
        if (term.find(kBoundary) != Term::npos || term.find(kWildcard) != Term::npos) continue;
        result.insert(term);
    }
    return result;
}

void KGramIndex::insert(const Term& term) {
    if (term.find(kBoundary) != Term::npos || term.find(kWildcard) != Term::npos) {
        throw std::invalid_argument("term contains a reserved character: " + term);
    }
    insertSorted(vocabulary_, term);
    for (const auto& gram : kgrams(term, k_)) {
        insertSorted(grams_[gram], term);
    }
}

const std::vector<Term>& KGramIndex::candidates(const std::string& gram) const {
    auto it = grams_.find(gram);
    return it == grams_.end() ? kNoCandidates : it->second;
}

// -----------------------------------------------------------
// Wildcard resolution
// -----------------------------------------------------------
std::vector<Term> matchingTerms(const KGramIndex& kgramIndex, const std::string& pattern) {
    if (pattern.find(kBoundary) != std::string::npos) {
        throw std::invalid_argument("wildcard pattern contains the boundary character");
    }

    std::vector<Sequence<Term>> lists;
    for (const auto& gram : kgrams(pattern, kgramIndex.k())) {
        if (gram.find(kWildcard) != std::string::npos) continue;
        lists.push_back(fromList(kgramIndex.candidates(gram)));
    }

    // No literal gram to narrow by: every term is a candidate
    auto candidates = lists.empty() ? fromList(kgramIndex.vocabulary()) : intersectAll(std::move(lists));

    std::vector<Term> out;
    for (const auto& term : candidates) {
        if (wildcardMatch(pattern, term)) out.push_back(term);
    }
    return out;
}

Sequence<DocId> queryWildcard(const InvertedIndex& index,
                              const KGramIndex& kgramIndex,
                              const std::string& pattern) {
    std::vector<Sequence<DocId>> lists;
    for (const auto& term : matchingTerms(kgramIndex, pattern)) {
        lists.push_back(fromList(index.postings(term)));
    }
    return unionAll(std::move(lists));
}

} // namespace miniretrieval::algo
