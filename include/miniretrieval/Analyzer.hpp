#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "miniretrieval/Types.hpp"

namespace miniretrieval {

// English stop words from Manning, Raghavan & Schutze (2008), p. 26.
const std::unordered_set<Term>& defaultStopWords();

struct AnalyzerConfig {
    bool lowercase = true;
    bool stripPunctuation = true;
    bool dropStopWords = true;
    std::unordered_set<Term> stopWords = defaultStopWords();
    // Exact token -> term replacements, applied instead of the default normalization.
    std::unordered_map<std::string, Term> replacements;
};

// Turns raw text into a normalized term stream: whitespace split, dictionary
// replacement or lowercase + punctuation stripping, then stop-word removal.
class Analyzer {
public:
    explicit Analyzer(AnalyzerConfig config = AnalyzerConfig{});

    static std::vector<std::string> splitWhitespace(const std::string& text);

    Term normalize(const std::string& token) const;
    std::vector<Term> analyze(const std::string& text) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    AnalyzerConfig config_;
};

} // namespace miniretrieval
