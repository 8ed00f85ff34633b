#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "miniretrieval/Analyzer.hpp"
#include "miniretrieval/Types.hpp"

namespace miniretrieval {

// Named raw documents. DocIds are assigned 1..N in ascending name order each
// time term streams are produced, so ids follow a total, stable order.
class DocumentLibrary {
public:
    // Loads every regular file "*.<extension>" directly inside dir, keyed by
    // file name. Throws std::runtime_error if dir is not a directory.
    static DocumentLibrary loadDirectory(const std::string& dir, const std::string& extension = "txt");

    // Adds or replaces a document.
    void add(const std::string& name, std::string content);
    bool remove(const std::string& name);

    std::size_t size() const { return documents_.size(); }
    bool empty() const { return documents_.empty(); }

    DocumentTerms termsFor(const Analyzer& analyzer) const;

    // Id <-> name under the current ordering.
    std::vector<std::string> names() const;
    std::optional<DocId> idOf(const std::string& name) const;
    const std::string& content(const std::string& name) const;

private:
    std::map<std::string, std::string> documents_;
};

} // namespace miniretrieval
