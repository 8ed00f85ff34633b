#include "miniretrieval/Analyzer.hpp"

#include <cctype>
#include <utility>

namespace miniretrieval {

const std::unordered_set<Term>& defaultStopWords() {
    static const std::unordered_set<Term> words = {
        "a", "an", "and", "are", "as", "at", "be", "by", "for", "from", "has", "he", "in",
        "is", "it", "its", "of", "on", "that", "the", "to", "was", "were", "will", "with"};
    return words;
}

Analyzer::Analyzer(AnalyzerConfig config) : config_(std::move(config)) {}

std::vector<std::string> Analyzer::splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (!std::isspace(ch)) {
            current.push_back(static_cast<char>(ch));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

Term Analyzer::normalize(const std::string& token) const {
    auto it = config_.replacements.find(token);
    if (it != config_.replacements.end() && !it->second.empty()) {
        return it->second;
    }

    Term term;
    term.reserve(token.size());
    for (unsigned char ch : token) {
        // Word characters only; bytes >= 0x80 are kept so UTF-8 survives
        if (config_.stripPunctuation && !(std::isalnum(ch) || ch == '_' || ch >= 0x80)) continue;
        term.push_back(static_cast<char>(config_.lowercase ? std::tolower(ch) : ch));
    }
    return term;
}

std::vector<Term> Analyzer::analyze(const std::string& text) const {
    std::vector<Term> terms;
    for (const auto& token : splitWhitespace(text)) {
        Term term = normalize(token);
        if (term.empty()) continue;
        if (config_.dropStopWords && config_.stopWords.count(term) != 0) continue;
        terms.push_back(std::move(term));
    }
    return terms;
}

} // namespace miniretrieval
