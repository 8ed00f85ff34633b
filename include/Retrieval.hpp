//Retrieval.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "miniretrieval/Analyzer.hpp"
#include "miniretrieval/Config.hpp"
#include "miniretrieval/DocumentLibrary.hpp"
#include "miniretrieval/Types.hpp"
#include "miniretrieval/algorithms/EditDistance.hpp"
#include "miniretrieval/algorithms/IndexBuilder.hpp"
#include "miniretrieval/algorithms/KGram.hpp"
#include "miniretrieval/algorithms/Proximity.hpp"

namespace miniretrieval {

// One immutable generation of every index over the same documents.
struct IndexSnapshot {
    uint64_t generation = 0;
    std::vector<std::string> names; // names[id - 1]
    algo::InvertedIndex inverted;
    algo::PositionalIndex positional;
    algo::KGramIndex kgrams;
};

class Retrieval {
public:
    static constexpr std::size_t kNoLimit = std::numeric_limits<std::size_t>::max();

    explicit Retrieval(AnalyzerConfig analyzer = AnalyzerConfig{}, std::size_t kgram = 2, bool compressPostings = true);
    explicit Retrieval(const ServerConfig& config);

    // --- Documents ---

    // Replaces the library with the directory contents and rebuilds.
    void loadDirectory(const std::string& dir, const std::string& extension);

    // Staged until the next rebuild().
    void addDocument(const std::string& name, std::string text);
    bool removeDocument(const std::string& name);

    // Adds (name, text) pairs and rebuilds in one step. If anything throws,
    // neither the library nor the published snapshot changes.
    void addDocuments(const std::vector<std::pair<std::string, std::string>>& documents);

    // Builds a fresh snapshot and swaps it in; in-flight queries keep the old one.
    void rebuild();

    std::shared_ptr<const IndexSnapshot> snapshot() const;
    std::size_t documentCount() const;
    std::string documentName(DocId id) const;
    static const std::string& documentName(const IndexSnapshot& snap, DocId id);

    // --- Queries (absent terms behave as empty lists) ---
    // Each query has an overload pinned to a caller-held snapshot, so ids can
    // be resolved to names against the same generation.

    // Every analyzed query term must occur.
    std::vector<DocId> queryAnd(const std::string& query, std::size_t limit = kNoLimit) const;
    // Any analyzed query term may occur.
    std::vector<DocId> queryOr(const std::string& query, std::size_t limit = kNoLimit) const;

    std::vector<algo::ProximityMatch> queryProximity(const std::string& first,
                                                     const std::string& second,
                                                     uint32_t proximity,
                                                     std::size_t limit = kNoLimit) const;

    // Exactly two terms after analysis, adjacent and in order.
    std::vector<algo::ProximityMatch> queryPhrase(const std::string& phrase, std::size_t limit = kNoLimit) const;

    std::vector<DocId> queryWildcard(const std::string& pattern, std::size_t limit = kNoLimit) const;
    std::vector<Term> wildcardTerms(const std::string& pattern) const;

    std::vector<algo::TermSuggestion> suggest(const std::string& word, int maxDistance) const;

    std::vector<DocId> queryAnd(const IndexSnapshot& snap, const std::string& query, std::size_t limit) const;
    std::vector<DocId> queryOr(const IndexSnapshot& snap, const std::string& query, std::size_t limit) const;
    std::vector<algo::ProximityMatch> queryProximity(const IndexSnapshot& snap,
                                                     const std::string& first,
                                                     const std::string& second,
                                                     uint32_t proximity,
                                                     std::size_t limit) const;
    std::vector<algo::ProximityMatch> queryPhrase(const IndexSnapshot& snap, const std::string& phrase, std::size_t limit) const;
    std::vector<DocId> queryWildcard(const IndexSnapshot& snap, const std::string& pattern, std::size_t limit) const;
    std::vector<Term> wildcardTerms(const IndexSnapshot& snap, const std::string& pattern) const;
    std::vector<algo::TermSuggestion> suggest(const IndexSnapshot& snap, const std::string& word, int maxDistance) const;

    PostingList postings(const std::string& term) const;
    std::string encodedPostings(const std::string& term) const;

    const Analyzer& analyzer() const { return analyzer_; }

private:
    void publish(std::shared_ptr<const IndexSnapshot> fresh);
    Term normalizeTerm(const std::string& word) const;
    std::string normalizePattern(const std::string& pattern) const;

    Analyzer analyzer_;
    std::size_t kgram_;
    bool compressPostings_;

    mutable std::mutex libraryMutex_;
    DocumentLibrary library_;
    uint64_t generation_ = 0;

    // Read and replaced only through std::atomic_load / std::atomic_store.
    std::shared_ptr<const IndexSnapshot> snapshot_;
};

} // namespace miniretrieval
