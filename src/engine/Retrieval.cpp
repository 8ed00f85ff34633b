//Retrieval.cpp
#include "Retrieval.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>
#include "miniretrieval/PostingCodec.hpp"
#include "miniretrieval/algorithms/Merge.hpp"

namespace miniretrieval {

namespace {

std::shared_ptr<const IndexSnapshot> makeSnapshot(const DocumentLibrary& library,
                                                  const Analyzer& analyzer,
                                                  std::size_t kgram,
                                                  uint64_t generation) {
    auto terms = library.termsFor(analyzer);
    auto positional = algo::PositionalIndex::build(terms);
    auto inverted = algo::InvertedIndex::build(terms);
    auto kgrams = algo::KGramIndex::build(inverted, kgram);
    return std::make_shared<const IndexSnapshot>(IndexSnapshot{
        generation, library.names(), std::move(inverted), std::move(positional), std::move(kgrams)});
}

} // namespace

// -----------------------------------------------------------
// CTOR
// -----------------------------------------------------------
Retrieval::Retrieval(AnalyzerConfig analyzer, std::size_t kgram, bool compressPostings)
    : analyzer_(std::move(analyzer)), kgram_(kgram), compressPostings_(compressPostings) {
    snapshot_ = makeSnapshot(library_, analyzer_, kgram_, generation_);
}

Retrieval::Retrieval(const ServerConfig& config)
    : Retrieval(config.analyzer, config.kgram, config.compressPostings) {}

// -----------------------------------------------------------
// PUBLIC: Documents
// -----------------------------------------------------------
void Retrieval::loadDirectory(const std::string& dir, const std::string& extension) {
    auto loaded = DocumentLibrary::loadDirectory(dir, extension);
    std::lock_guard<std::mutex> lock(libraryMutex_);
    auto fresh = makeSnapshot(loaded, analyzer_, kgram_, generation_ + 1);
    library_ = std::move(loaded);
    publish(std::move(fresh));
}

void Retrieval::addDocument(const std::string& name, std::string text) {
    if (name.empty()) throw std::invalid_argument("document name must not be empty");
    std::lock_guard<std::mutex> lock(libraryMutex_);
    library_.add(name, std::move(text));
}

bool Retrieval::removeDocument(const std::string& name) {
    std::lock_guard<std::mutex> lock(libraryMutex_);
    return library_.remove(name);
}

void Retrieval::addDocuments(const std::vector<std::pair<std::string, std::string>>& documents) {
    std::lock_guard<std::mutex> lock(libraryMutex_);
    // Stage into a copy so a rejected batch leaves the library untouched
    DocumentLibrary staged = library_;
    for (const auto& [name, text] : documents) {
        if (name.empty()) throw std::invalid_argument("document name must not be empty");
        staged.add(name, text);
    }
    auto fresh = makeSnapshot(staged, analyzer_, kgram_, generation_ + 1);
    library_ = std::move(staged);
    publish(std::move(fresh));
}

void Retrieval::rebuild() {
    std::lock_guard<std::mutex> lock(libraryMutex_);
    publish(makeSnapshot(library_, analyzer_, kgram_, generation_ + 1));
}

// Caller holds libraryMutex_. The generation only advances once a build succeeded.
void Retrieval::publish(std::shared_ptr<const IndexSnapshot> fresh) {
    generation_ = fresh->generation;
    std::atomic_store(&snapshot_, fresh);
    std::cout << "Retrieval: rebuilt snapshot " << fresh->generation << " ("
              << fresh->names.size() << " docs, " << fresh->inverted.termCount() << " terms)" << std::endl;
}

std::shared_ptr<const IndexSnapshot> Retrieval::snapshot() const {
    return std::atomic_load(&snapshot_);
}

std::size_t Retrieval::documentCount() const {
    return snapshot()->names.size();
}

std::string Retrieval::documentName(DocId id) const {
    return documentName(*snapshot(), id);
}

const std::string& Retrieval::documentName(const IndexSnapshot& snap, DocId id) {
    if (id == 0 || id > snap.names.size()) {
        throw std::out_of_range("Document ID not found: " + std::to_string(id));
    }
    return snap.names[id - 1];
}

// -----------------------------------------------------------
// PUBLIC: Boolean queries
// -----------------------------------------------------------
std::vector<DocId> Retrieval::queryAnd(const IndexSnapshot& snap, const std::string& query, std::size_t limit) const {
    auto terms = analyzer_.analyze(query);
    if (terms.empty()) return {};

    std::vector<algo::Sequence<DocId>> lists;
    for (const auto& term : terms) {
        lists.push_back(algo::fromList(snap.inverted.postings(term)));
    }
    return algo::intersectAll(std::move(lists)).take(limit);
}

std::vector<DocId> Retrieval::queryOr(const IndexSnapshot& snap, const std::string& query, std::size_t limit) const {
    std::vector<algo::Sequence<DocId>> lists;
    for (const auto& term : analyzer_.analyze(query)) {
        lists.push_back(algo::fromList(snap.inverted.postings(term)));
    }
    return algo::unionAll(std::move(lists)).take(limit);
}

// -----------------------------------------------------------
// PUBLIC: Positional queries
// -----------------------------------------------------------
std::vector<algo::ProximityMatch> Retrieval::queryProximity(const IndexSnapshot& snap,
                                                            const std::string& first,
                                                            const std::string& second,
                                                            uint32_t proximity,
                                                            std::size_t limit) const {
    return algo::queryProximity(snap.positional, normalizeTerm(first), normalizeTerm(second), proximity)
        .take(limit);
}

std::vector<algo::ProximityMatch> Retrieval::queryPhrase(const IndexSnapshot& snap, const std::string& phrase, std::size_t limit) const {
    auto terms = analyzer_.analyze(phrase);
    if (terms.size() != 2) {
        throw std::invalid_argument("phrase query needs exactly two terms, got " + std::to_string(terms.size()));
    }
    return algo::phraseIntersect(snap.positional.postings(terms[0]), snap.positional.postings(terms[1]))
        .take(limit);
}

// -----------------------------------------------------------
// PUBLIC: Tolerant retrieval
// -----------------------------------------------------------
std::vector<DocId> Retrieval::queryWildcard(const IndexSnapshot& snap, const std::string& pattern, std::size_t limit) const {
    return algo::queryWildcard(snap.inverted, snap.kgrams, normalizePattern(pattern)).take(limit);
}

std::vector<Term> Retrieval::wildcardTerms(const IndexSnapshot& snap, const std::string& pattern) const {
    return algo::matchingTerms(snap.kgrams, normalizePattern(pattern));
}

std::vector<algo::TermSuggestion> Retrieval::suggest(const IndexSnapshot& snap, const std::string& word, int maxDistance) const {
    return algo::nearestTerms(snap.inverted.terms(), normalizeTerm(word), maxDistance);
}

// -----------------------------------------------------------
// PUBLIC: Queries against the current snapshot
// -----------------------------------------------------------
std::vector<DocId> Retrieval::queryAnd(const std::string& query, std::size_t limit) const {
    return queryAnd(*snapshot(), query, limit);
}

std::vector<DocId> Retrieval::queryOr(const std::string& query, std::size_t limit) const {
    return queryOr(*snapshot(), query, limit);
}

std::vector<algo::ProximityMatch> Retrieval::queryProximity(const std::string& first,
                                                            const std::string& second,
                                                            uint32_t proximity,
                                                            std::size_t limit) const {
    return queryProximity(*snapshot(), first, second, proximity, limit);
}

std::vector<algo::ProximityMatch> Retrieval::queryPhrase(const std::string& phrase, std::size_t limit) const {
    return queryPhrase(*snapshot(), phrase, limit);
}

std::vector<DocId> Retrieval::queryWildcard(const std::string& pattern, std::size_t limit) const {
    return queryWildcard(*snapshot(), pattern, limit);
}

std::vector<Term> Retrieval::wildcardTerms(const std::string& pattern) const {
    return wildcardTerms(*snapshot(), pattern);
}

std::vector<algo::TermSuggestion> Retrieval::suggest(const std::string& word, int maxDistance) const {
    return suggest(*snapshot(), word, maxDistance);
}

// -----------------------------------------------------------
// PUBLIC: Postings
// -----------------------------------------------------------
PostingList Retrieval::postings(const std::string& term) const {
    auto snap = snapshot();
    return snap->inverted.postings(normalizeTerm(term));
}

std::string Retrieval::encodedPostings(const std::string& term) const {
    return encodePostingBlock(postings(term), compressPostings_);
}

// -----------------------------------------------------------
// PRIVATE: Query normalization
// -----------------------------------------------------------
Term Retrieval::normalizeTerm(const std::string& word) const {
    return analyzer_.normalize(word);
}

std::string Retrieval::normalizePattern(const std::string& pattern) const {
    if (!analyzer_.config().lowercase) return pattern;
    std::string out;
    out.reserve(pattern.size());
    for (unsigned char ch : pattern) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

} // namespace miniretrieval
