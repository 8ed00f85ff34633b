#include "miniretrieval/algorithms/EditDistance.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace miniretrieval;
using algo::EditDistanceTable;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static std::vector<char> chars(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

// Applying an alignment to the source must reproduce the destination.
static bool reconstructs(const algo::Alignment<char>& ops, const std::string& source, const std::string& dest) {
    std::string fromSource;
    std::string toDest;
    for (const auto& op : ops) {
        if (op.source) fromSource.push_back(*op.source);
        if (op.dest) toDest.push_back(*op.dest);
    }
    return fromSource == source && toDest == dest;
}

static void testClassicExample() {
    expect(algo::editDistance("kitten", "sitting") == 3.0, "kitten -> sitting is 3");
    EditDistanceTable<char> table(chars("kitten"), chars("sitting"));
    expect(table.rows() == 8 && table.cols() == 7, "table is (dest+1) x (source+1)");
    expect(table.at(0, 0) == 0.0, "origin is zero");
    auto ops = table.alignment();
    expect(table.cost(ops) == table.distance(), "alignment cost equals distance");
    expect(reconstructs(ops, "kitten", "sitting"), "alignment spells both strings");
}

static void testEmptyInputs() {
    expect(algo::editDistance("", "") == 0.0, "both empty");
    expect(algo::alignStrings("", "").empty(), "empty alignment");

    expect(algo::editDistance("", "abc") == 3.0, "pure insertion");
    auto inserts = algo::alignStrings("", "abc");
    expect(inserts.size() == 3, "three insertions");
    for (const auto& op : inserts) expect(op.isInsertion(), "only insertions");

    expect(algo::editDistance("abc", "") == 3.0, "pure deletion");
    auto deletes = algo::alignStrings("abc", "");
    expect(deletes.size() == 3, "three deletions");
    for (const auto& op : deletes) expect(op.isDeletion(), "only deletions");
}

static void testBoundaries() {
    EditDistanceTable<char> table(chars("abc"), chars("xy"));
    for (size_t j = 0; j < table.cols(); ++j) expect(table.at(0, j) == static_cast<double>(j), "row 0 prefix costs");
    for (size_t i = 0; i < table.rows(); ++i) expect(table.at(i, 0) == static_cast<double>(i), "column 0 prefix costs");

    bool threw = false;
    try {
        table.at(3, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expect(threw, "out of range cell");
}

static void testTieBreak() {
    // Two substitutions and delete+insert pairs all cost 2; substitution wins
    auto ops = algo::alignStrings("ab", "ba");
    expect(ops.size() == 2, "two operations");
    expect(ops[0].isSubstitution() && *ops[0].source == 'a' && *ops[0].dest == 'b', "first substitution");
    expect(ops[1].isSubstitution() && *ops[1].source == 'b' && *ops[1].dest == 'a', "second substitution");

    auto same = algo::alignStrings("abc", "abc");
    expect(same.size() == 3, "identity alignment");
    for (const auto& op : same) expect(op.isSubstitution() && *op.source == *op.dest, "matches only");
}

static void testWeightedCosts() {
    auto costs = algo::EditCosts<char>::unit();
    costs.substitution = [](const char& a, const char& b) { return a == b ? 0.0 : 3.0; };
    EditDistanceTable<char> table(chars("a"), chars("b"), costs);
    expect(table.distance() == 2.0, "delete + insert beats expensive substitution");
    auto ops = table.alignment();
    expect(ops.size() == 2, "two operations");
    expect(table.cost(ops) == 2.0, "weighted alignment cost");
    expect(reconstructs(ops, "a", "b"), "weighted alignment spells both");

    algo::EditCosts<char> halves{
        [](const char&) { return 0.5; },
        [](const char&) { return 0.25; },
        [](const char& a, const char& b) { return a == b ? 0.0 : 1.0; }
    };
    EditDistanceTable<char> fractional(chars("flaw"), chars("lawn"), halves);
    expect(fractional.distance() == 0.75, "rational costs");
    expect(fractional.cost(fractional.alignment()) == fractional.distance(), "fractional alignment cost");

    algo::EditCosts<char> negative = algo::EditCosts<char>::unit();
    negative.insertion = [](const char&) { return -1.0; };
    bool threw = false;
    try {
        EditDistanceTable<char> bad(chars("a"), chars("bc"), negative);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "negative cost rejected");
}

static void testAlignmentCostProperty() {
    const std::vector<std::string> words = {"", "a", "ab", "abc", "intention", "execution", "kitten", "sitting",
                                            "flaw", "lawn", "saturday", "sunday", "aaaa", "baab"};
    for (const auto& s : words) {
        for (const auto& d : words) {
            EditDistanceTable<char> table(chars(s), chars(d));
            auto ops = table.alignment();
            expect(table.cost(ops) == table.distance(), "cost sum equals distance for " + s + "/" + d);
            expect(reconstructs(ops, s, d), "alignment reconstructs " + s + "/" + d);
            expect(algo::boundedEditDistance(s, d, 20) == static_cast<int>(table.distance()),
                   "bounded agrees with table for " + s + "/" + d);
        }
    }
}

static void testTokenSequences() {
    std::vector<std::string> source = {"the", "quick", "fox"};
    std::vector<std::string> dest = {"the", "slow", "brown", "fox"};
    EditDistanceTable<std::string> table(source, dest);
    expect(table.distance() == 2.0, "word-level distance");
}

static void testNearestTerms() {
    expect(algo::boundedEditDistance("kitten", "sitting", 1) == 2, "bounded exits early");
    expect(algo::boundedEditDistance("a", "abcdef", 2) == 3, "length gap exceeds bound");

    std::vector<Term> vocabulary = {"car", "cart", "cat", "dog", "cast"};
    auto suggestions = algo::nearestTerms(vocabulary, "cat", 1);
    expect(suggestions.size() == 4, "four terms within 1");
    expect(suggestions[0].term == "cat" && suggestions[0].distance == 0, "exact term first");
    expect(suggestions[1].term == "car" && suggestions[2].term == "cart" && suggestions[3].term == "cast",
           "ties ordered by term");
    expect(algo::nearestTerms(vocabulary, "zzz", 1).empty(), "nothing close");
    expect(algo::nearestTerms(vocabulary, "cat", -1).empty(), "negative bound");
}

int main() {
    testClassicExample();
    testEmptyInputs();
    testBoundaries();
    testTieBreak();
    testWeightedCosts();
    testAlignmentCostProperty();
    testTokenSequences();
    testNearestTerms();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
