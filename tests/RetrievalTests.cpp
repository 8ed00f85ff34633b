#include "Retrieval.hpp"
#include "miniretrieval/PostingCodec.hpp"
#include "miniretrieval/QueryService.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using miniretrieval::DocId;
using miniretrieval::PositionList;
using miniretrieval::QueryService;
using miniretrieval::Retrieval;
using json = nlohmann::json;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static void seed(Retrieval& engine) {
    engine.addDocument("a.txt", "The quick brown fox");
    engine.addDocument("b.txt", "quick red car");
    engine.addDocument("c.txt", "A cart for the cat");
    engine.rebuild();
}

static void testQueries() {
    Retrieval engine;
    expect(engine.documentCount() == 0, "starts empty");
    expect(engine.queryAnd("anything").empty(), "empty engine answers nothing");
    seed(engine);
    expect(engine.documentCount() == 3, "three documents");
    expect(engine.documentName(2) == "b.txt", "id to name");

    expect((engine.queryAnd("Quick FOX") == std::vector<DocId>{1}), "AND query");
    expect((engine.queryAnd("quick") == std::vector<DocId>{1, 2}), "single-term AND");
    expect(engine.queryAnd("quick unicorn").empty(), "absent term empties AND");
    expect((engine.queryOr("fox car") == std::vector<DocId>{1, 2}), "OR query");
    expect((engine.queryOr("fox unicorn") == std::vector<DocId>{1}), "absent term ignored by OR");
    expect((engine.queryOr("quick cat", 2) == std::vector<DocId>{1, 2}), "limit short-circuits");
    expect(engine.queryAnd("the").empty(), "stop words only");

    auto near = engine.queryProximity("quick", "fox", 2);
    expect(near.size() == 1 && near[0].doc == 1 && near[0].positions == PositionList{0}, "proximity 2");
    expect(engine.queryProximity("quick", "fox", 1).empty(), "proximity 1 misses");

    auto phrase = engine.queryPhrase("quick brown");
    expect(phrase.size() == 1 && phrase[0].doc == 1, "phrase query");
    bool threw = false;
    try {
        engine.queryPhrase("quick");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "phrase needs two terms");

    expect((engine.queryWildcard("CA*") == std::vector<DocId>{2, 3}), "wildcard documents");
    expect((engine.wildcardTerms("ca*") == std::vector<std::string>{"car", "cart", "cat"}), "wildcard terms");

    auto suggestions = engine.suggest("cst", 1);
    expect(suggestions.size() == 1 && suggestions[0].term == "cat", "suggestion");

    expect((engine.postings("quick") == std::vector<DocId>{1, 2}), "postings");
    expect(miniretrieval::decodePostingBlock(engine.encodedPostings("quick")) == engine.postings("quick"),
           "encoded postings decode");
}

static void testSnapshotSwap() {
    Retrieval engine;
    seed(engine);
    auto before = engine.snapshot();
    engine.addDocument("d.txt", "quick cat");
    expect(engine.documentCount() == 3, "staged document not visible before rebuild");
    engine.rebuild();
    auto after = engine.snapshot();
    expect(after->generation == before->generation + 1, "generation advances");
    expect(before->names.size() == 3 && after->names.size() == 4, "old snapshot untouched");
    expect(before->inverted.postings("quick").size() == 2, "old postings untouched");
    expect(after->inverted.postings("quick").size() == 3, "new postings visible");
    expect(engine.removeDocument("d.txt"), "remove staged document");
}

static void testService() {
    Retrieval engine;
    QueryService service(engine);

    auto added = service.addDocuments(json::array({
        {{"name", "a.txt"}, {"text", "The quick brown fox"}},
        {{"name", "b.txt"}, {"text", "quick red car"}},
        {{"name", "c.txt"}, {"text", "A cart for the cat"}}
    }));
    expect(added.status == 201 && added.body["data"]["added"] == 3, "documents added");
    expect(service.addDocuments(json{{"text", "nameless"}}).status == 400, "missing name rejected");

    auto health = service.health();
    expect(health.body["status"] == "ok" && health.body["data"]["docs"] == 3, "health");

    auto andReply = service.search("and", {{"q", "quick fox"}});
    expect(andReply.status == 200, "and status");
    expect(andReply.body["data"]["hits"].size() == 1 && andReply.body["data"]["hits"][0]["name"] == "a.txt", "and hits");

    auto wild = service.search("wildcard", {{"q", "ca*"}, {"limit", "1"}});
    expect(wild.body["data"]["hits"].size() == 1 && wild.body["data"]["terms"].size() == 3, "wildcard reply");

    auto prox = service.search("proximity", {{"t1", "quick"}, {"t2", "fox"}, {"k", "2"}});
    expect(prox.body["data"]["hits"][0]["positions"] == json::array({0}), "proximity reply");

    expect(service.search("and", {}).status == 400, "missing q");
    expect(service.search("proximity", {{"t1", "a"}, {"t2", "b"}, {"k", "-1"}}).status == 400, "negative k");
    expect(service.search("proximity", {{"t1", "a"}, {"t2", "b"}, {"k", "two"}}).status == 400, "non-numeric k");
    expect(service.search("regex", {{"q", "x"}}).status == 400, "unknown mode");
    expect(service.search("phrase", {{"q", "quick"}}).status == 400, "bad phrase");

    auto suggest = service.suggest({{"q", "cst"}, {"max", "1"}});
    expect(suggest.body["data"]["suggestions"][0]["term"] == "cat", "suggest reply");

    auto postings = service.postings("quick");
    expect(postings.body["data"]["ids"] == json::array({1, 2}), "postings ids");
    expect(postings.body["data"]["gaps"] == json::array({1, 1}), "postings gaps");

    auto distance = service.distance({{"source", "kitten"}, {"dest", "sitting"}});
    expect(distance.body["data"]["distance"] == 3.0, "distance reply");
    expect(distance.body["data"]["alignment"].size() >= 7, "alignment reply");
    auto empty = service.distance({{"source", ""}, {"dest", "ab"}});
    expect(empty.status == 200 && empty.body["data"]["distance"] == 2.0, "empty source allowed");
    expect(empty.body["data"]["alignment"][0]["source"].is_null(), "insertion has no source");
}

static void testReservedCharacterTerms() {
    miniretrieval::AnalyzerConfig config;
    config.stripPunctuation = false;
    Retrieval engine(config);
    engine.addDocument("price.txt", "costs $5 today");
    engine.addDocument("star.txt", "a*b costs");
    engine.rebuild();

    expect(engine.snapshot()->generation == 1, "rebuild with reserved characters succeeds");
    expect((engine.queryAnd("$5") == std::vector<DocId>{1}), "reserved term matched exactly");
    expect((engine.queryAnd("a*b") == std::vector<DocId>{2}), "star term matched exactly");
    expect((engine.wildcardTerms("cost*") == std::vector<std::string>{"costs"}), "wildcard still works");
    auto suggestions = engine.suggest("cost", 1);
    expect(!suggestions.empty() && suggestions[0].term == "costs", "suggest still works");

    QueryService service(engine);
    auto added = service.addDocuments(json{{"name", "plain.txt"}, {"text", "today only"}});
    expect(added.status == 201 && added.body["data"]["docs"] == 3, "later additions still accepted");
    expect(engine.snapshot()->generation == 2, "generation advances once per build");
}

static void testRejectedBatchLeavesLibrary() {
    Retrieval engine;
    seed(engine);
    auto before = engine.snapshot();

    bool threw = false;
    try {
        engine.addDocuments({{"d.txt", "quick cat"}, {"", "no name"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "empty name in a batch rejected");
    expect(engine.snapshot() == before, "snapshot unchanged after rejected batch");
    engine.rebuild();
    expect(engine.documentCount() == 3, "rejected batch not staged");
    expect(engine.snapshot()->generation == before->generation + 1, "no generation consumed by the failure");

    QueryService service(engine);
    auto reply = service.addDocuments(json::array({
        {{"name", "e.txt"}, {"text", "quick"}},
        {{"text", "nameless"}}
    }));
    expect(reply.status == 400, "batch with a nameless document rejected");
    expect(engine.documentCount() == 3, "no partial batch published");
    engine.rebuild();
    expect(engine.documentCount() == 3, "no partial batch staged");
}

static void testNamesFromPinnedSnapshot() {
    Retrieval engine;
    seed(engine);
    auto old = engine.snapshot();
    auto ids = engine.queryAnd(*old, "quick fox", Retrieval::kNoLimit);

    // "0.txt" sorts first, so every id shifts in the next generation
    engine.addDocuments({{"0.txt", "slow turtle"}});
    expect(engine.documentName(1) == "0.txt", "current snapshot renumbered");

    expect((ids == std::vector<DocId>{1}), "old snapshot ids");
    expect(Retrieval::documentName(*old, ids[0]) == "a.txt", "old snapshot names");
    auto fresh = engine.snapshot();
    auto freshIds = engine.queryAnd(*fresh, "quick fox", Retrieval::kNoLimit);
    expect((freshIds == std::vector<DocId>{2}), "new snapshot ids");
    expect(Retrieval::documentName(*fresh, freshIds[0]) == "a.txt", "new snapshot names");

    QueryService service(engine);
    auto reply = service.search("and", {{"q", "quick fox"}});
    expect(reply.body["data"]["hits"][0]["id"] == 2 && reply.body["data"]["hits"][0]["name"] == "a.txt",
           "service resolves names against its own snapshot");
}

int main() {
    testQueries();
    testSnapshotSwap();
    testService();
    testReservedCharacterTerms();
    testRejectedBatchLeavesLibrary();
    testNamesFromPinnedSnapshot();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
