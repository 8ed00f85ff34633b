#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "miniretrieval/Analyzer.hpp"

namespace miniretrieval {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string documentDir = "documents";
    std::string documentExtension = "txt";
    std::size_t kgram = 2;
    bool compressPostings = true;
    AnalyzerConfig analyzer;

    // Missing keys keep their defaults; unknown keys are ignored.
    static ServerConfig fromJson(const nlohmann::json& j);
    static ServerConfig load(const std::string& path);
};

} // namespace miniretrieval
