#include "miniretrieval/algorithms/IndexBuilder.hpp"

#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace miniretrieval;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static DocumentTerms sampleDocs() {
    return {
        {1, {"a", "b", "c"}},
        {2, {"x", "a", "y", "b"}},
        {5, {"b", "b", "a", "b"}},
    };
}

static DocumentTerms randomDocs(unsigned seed) {
    std::mt19937 rng(seed);
    const std::vector<std::string> vocab = {"alpha", "beta", "gamma", "delta", "eps", "zeta"};
    DocumentTerms docs;
    DocId id = 0;
    for (int d = 0; d < 30; ++d) {
        id += 1 + rng() % 4;
        auto& terms = docs[id];
        int n = static_cast<int>(rng() % 12);
        for (int i = 0; i < n; ++i) terms.push_back(vocab[rng() % vocab.size()]);
    }
    return docs;
}

static bool strictlyAscending(const PostingList& list) {
    for (size_t i = 1; i < list.size(); ++i) {
        if (list[i - 1] >= list[i]) return false;
    }
    return true;
}

static void testInvertedIndex() {
    auto index = algo::InvertedIndex::build(sampleDocs());
    expect((index.postings("a") == PostingList{1, 2, 5}), "postings for a");
    expect((index.postings("b") == PostingList{1, 2, 5}), "postings for b deduplicated");
    expect((index.postings("c") == PostingList{1}), "postings for c");
    expect(index.postings("missing").empty(), "absent term is empty");
    expect(!index.contains("missing") && index.contains("x"), "contains");
    expect(index.termCount() == 5, "five distinct terms");
    expect((index.terms() == std::vector<Term>{"a", "b", "c", "x", "y"}), "terms sorted");

    auto empty = algo::InvertedIndex::build({});
    expect(empty.termCount() == 0 && empty.postings("a").empty(), "empty collection");
}

static void testInvariantAndDeterminism() {
    for (unsigned seed = 1; seed <= 20; ++seed) {
        auto docs = randomDocs(seed);
        auto first = algo::InvertedIndex::build(docs);
        auto second = algo::InvertedIndex::build(docs);
        for (const auto& term : first.terms()) {
            expect(strictlyAscending(first.postings(term)), "posting list strictly ascending");
            expect(first.postings(term) == second.postings(term), "rebuild is identical");
        }
        expect(first.terms() == second.terms(), "same vocabulary on rebuild");

        auto positional = algo::PositionalIndex::build(docs);
        auto projected = positional.toInvertedIndex();
        for (const auto& term : first.terms()) {
            expect(projected.postings(term) == first.postings(term), "positional projection matches");
            for (const auto& p : positional.postings(term)) {
                expect(!p.positions.empty(), "no empty position lists");
                expect(strictlyAscending(p.positions), "positions strictly ascending");
            }
        }
    }
}

static void testPositionalIndex() {
    auto index = algo::PositionalIndex::build(sampleDocs());
    PositionalPostingList expectedB = {{1, {1}}, {2, {3}}, {5, {0, 1, 3}}};
    expect(index.postings("b") == expectedB, "positions for b");
    PositionalPostingList expectedA = {{1, {0}}, {2, {1}}, {5, {2}}};
    expect(index.postings("a") == expectedA, "positions for a");
    expect(index.postings("nothing").empty(), "absent term has no positions");
    expect(index.termCount() == 5, "positional vocabulary");
}

int main() {
    testInvertedIndex();
    testInvariantAndDeterminism();
    testPositionalIndex();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
