#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "miniretrieval/Types.hpp"
#include "miniretrieval/algorithms/IndexBuilder.hpp"
#include "miniretrieval/algorithms/Sequence.hpp"

namespace miniretrieval::algo {

constexpr char kBoundary = '$';
constexpr char kWildcard = '*';

// Every length-k window of "$term$". Empty when the padded term is shorter than k.
std::vector<std::string> kgrams(std::string_view term, std::size_t k);

// Anchored glob match: '*' matches any run of zero or more characters.
bool wildcardMatch(std::string_view pattern, std::string_view term);

// k-gram -> sorted, duplicate-free terms containing it.
class KGramIndex {
public:
    // Throws std::invalid_argument for a term containing '$' or '*'.
    static KGramIndex build(const std::vector<Term>& vocabulary, std::size_t k);
    // Skips terms containing '$' or '*' instead of throwing.
    static KGramIndex build(const InvertedIndex& index, std::size_t k);

    std::size_t k() const { return k_; }

    // Absent grams yield an empty list.
    const std::vector<Term>& candidates(const std::string& gram) const;

    const std::vector<Term>& vocabulary() const { return vocabulary_; }
    std::size_t gramCount() const { return grams_.size(); }

private:
    explicit KGramIndex(std::size_t k) : k_(k) {}
    void insert(const Term& term);

    std::size_t k_;
    std::unordered_map<std::string, std::vector<Term>> grams_;
    std::vector<Term> vocabulary_;
};

// Terms of the k-gram index matching the pattern, ascending. A pattern with no
// wildcard-free gram is matched against the whole vocabulary.
std::vector<Term> matchingTerms(const KGramIndex& kgramIndex, const std::string& pattern);

// Union of the posting lists of every matching term. `index` must outlive the result.
Sequence<DocId> queryWildcard(const InvertedIndex& index,
                              const KGramIndex& kgramIndex,
                              const std::string& pattern);

} // namespace miniretrieval::algo
