#include "miniretrieval/DocumentLibrary.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace miniretrieval {

DocumentLibrary DocumentLibrary::loadDirectory(const std::string& dir, const std::string& extension) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("DocumentLibrary: not a directory: " + dir);
    }

    DocumentLibrary library;
    const std::string suffix = "." + extension;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension().string() != suffix) continue;

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            std::cerr << "DocumentLibrary: cannot read " << entry.path().string() << "; skipping\n";
            continue;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        library.add(entry.path().filename().string(), std::move(content));
    }
    std::cout << "DocumentLibrary: loaded " << library.size() << " documents from " << dir << std::endl;
    return library;
}

void DocumentLibrary::add(const std::string& name, std::string content) {
    documents_[name] = std::move(content);
}

bool DocumentLibrary::remove(const std::string& name) {
    return documents_.erase(name) != 0;
}

DocumentTerms DocumentLibrary::termsFor(const Analyzer& analyzer) const {
    DocumentTerms out;
    DocId id = 1;
    for (const auto& [name, content] : documents_) {
        out.emplace(id++, analyzer.analyze(content));
    }
    return out;
}

std::vector<std::string> DocumentLibrary::names() const {
    std::vector<std::string> out;
    out.reserve(documents_.size());
    for (const auto& kv : documents_) out.push_back(kv.first);
    return out;
}

std::optional<DocId> DocumentLibrary::idOf(const std::string& name) const {
    auto it = documents_.find(name);
    if (it == documents_.end()) return std::nullopt;
    return static_cast<DocId>(std::distance(documents_.begin(), it) + 1);
}

const std::string& DocumentLibrary::content(const std::string& name) const {
    auto it = documents_.find(name);
    if (it == documents_.end()) {
        throw std::runtime_error("Document not found: " + name);
    }
    return it->second;
}

} // namespace miniretrieval
