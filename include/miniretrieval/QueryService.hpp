#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace miniretrieval {

class Retrieval;

// JSON request handling behind the HTTP routes, kept free of sockets.
class QueryService {
public:
    using Params = std::map<std::string, std::string>;

    struct Reply {
        int status;
        nlohmann::json body;
    };

    explicit QueryService(Retrieval& engine) : engine_(engine) {}

    Reply health() const;

    // {"name": ..., "text": ...} or an array of them; rebuilds once afterwards.
    Reply addDocuments(const nlohmann::json& body);

    // mode: and | or | phrase | wildcard | proximity
    Reply search(const std::string& mode, const Params& params) const;

    Reply suggest(const Params& params) const;
    Reply postings(const std::string& term) const;
    Reply distance(const Params& params) const;

    static nlohmann::json ok(const nlohmann::json& data);
    static nlohmann::json err(int code, const std::string& message);

private:
    template <typename Fn>
    Reply guarded(Fn&& fn) const;

    Retrieval& engine_;
};

} // namespace miniretrieval
