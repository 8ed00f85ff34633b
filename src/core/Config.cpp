#include "miniretrieval/Config.hpp"

#include <fstream>

using json = nlohmann::json;

namespace miniretrieval {

namespace {

template <typename T>
void readField(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

void readAnalyzer(const json& j, AnalyzerConfig& cfg) {
    if (!j.is_object()) throw ConfigError("config: 'analyzer' must be an object");
    readField(j, "lowercase", cfg.lowercase);
    readField(j, "stripPunctuation", cfg.stripPunctuation);
    readField(j, "dropStopWords", cfg.dropStopWords);
    readField(j, "stopWords", cfg.stopWords);
    readField(j, "replacements", cfg.replacements);
}

} // namespace

ServerConfig ServerConfig::fromJson(const json& j) {
    if (!j.is_object()) throw ConfigError("config: top level must be an object");

    ServerConfig cfg;
    readField(j, "host", cfg.host);
    readField(j, "port", cfg.port);
    readField(j, "kgram", cfg.kgram);
    readField(j, "compressPostings", cfg.compressPostings);
    if (j.contains("documents")) {
        const auto& docs = j.at("documents");
        if (!docs.is_object()) throw ConfigError("config: 'documents' must be an object");
        readField(docs, "dir", cfg.documentDir);
        readField(docs, "extension", cfg.documentExtension);
    }
    if (j.contains("analyzer")) {
        readAnalyzer(j.at("analyzer"), cfg.analyzer);
    }

    if (cfg.port <= 0 || cfg.port > 65535) throw ConfigError("config: port out of range");
    if (cfg.kgram == 0) throw ConfigError("config: kgram must be at least 1");
    return cfg;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("config: cannot open " + path);
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError("config: invalid JSON in " + path);
    return fromJson(j);
}

} // namespace miniretrieval
