#include "miniretrieval/algorithms/EditDistance.hpp"

#include <cstdlib>

namespace miniretrieval::algo {

namespace {
std::vector<char> chars(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}
} // namespace

double editDistance(const std::string& source, const std::string& dest) {
    return EditDistanceTable<char>(chars(source), chars(dest)).distance();
}

Alignment<char> alignStrings(const std::string& source, const std::string& dest) {
    return EditDistanceTable<char>(chars(source), chars(dest)).alignment();
}

int boundedEditDistance(const std::string& a, const std::string& b, int maxCost) {
    const int n = static_cast<int>(a.size());
    const int m = static_cast<int>(b.size());
    if (std::abs(n - m) > maxCost) return maxCost + 1;

    std::vector<int> prev(m + 1), curr(m + 1);
    for (int j = 0; j <= m; ++j) prev[j] = j;

    for (int i = 1; i <= n; ++i) {
        curr[0] = i;
        int rowMin = curr[0];
        for (int j = 1; j <= m; ++j) {
            int cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
            rowMin = std::min(rowMin, curr[j]);
        }
        if (rowMin > maxCost) return maxCost + 1;
        std::swap(prev, curr);
    }
    // Anything past the bound reads as maxCost + 1
    return std::min(prev[m], maxCost + 1);
}

std::vector<TermSuggestion> nearestTerms(const std::vector<Term>& vocabulary,
                                         const std::string& query,
                                         int maxDistance) {
    std::vector<TermSuggestion> out;
    if (maxDistance < 0) return out;
    for (const auto& term : vocabulary) {
        int d = boundedEditDistance(query, term, maxDistance);
        if (d <= maxDistance) out.push_back({term, d});
    }
    std::sort(out.begin(), out.end(), [](const TermSuggestion& a, const TermSuggestion& b) {
        if (a.distance == b.distance) return a.term < b.term;
        return a.distance < b.distance;
    });
    return out;
}

} // namespace miniretrieval::algo
