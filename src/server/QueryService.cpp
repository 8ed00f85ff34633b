#include "miniretrieval/QueryService.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>
#include "Retrieval.hpp"
#include "miniretrieval/algorithms/GapCodec.hpp"

using json = nlohmann::json;

namespace miniretrieval {

namespace {

class BadRequest : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

const std::string& required(const QueryService::Params& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        throw BadRequest("Missing parameter '" + key + "'");
    }
    return it->second;
}

// Present but possibly empty.
const std::string& param(const QueryService::Params& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) throw BadRequest("Missing parameter '" + key + "'");
    return it->second;
}

long long numeric(const QueryService::Params& params, const std::string& key, long long fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(it->second, &used);
    } catch (const std::exception&) {
        throw BadRequest("Parameter '" + key + "' must be an integer");
    }
    if (used != it->second.size()) throw BadRequest("Parameter '" + key + "' must be an integer");
    return value;
}

std::size_t limitOf(const QueryService::Params& params) {
    long long limit = numeric(params, "limit", -1);
    if (limit < 0) return Retrieval::kNoLimit;
    return static_cast<std::size_t>(limit);
}

json docHits(const IndexSnapshot& snap, const std::vector<DocId>& ids) {
    json hits = json::array();
    for (auto id : ids) {
        hits.push_back({{"id", id}, {"name", Retrieval::documentName(snap, id)}});
    }
    return hits;
}

json proximityHits(const IndexSnapshot& snap, const std::vector<algo::ProximityMatch>& matches) {
    json hits = json::array();
    for (const auto& m : matches) {
        hits.push_back({{"id", m.doc}, {"name", Retrieval::documentName(snap, m.doc)}, {"positions", m.positions}});
    }
    return hits;
}

} // namespace

json QueryService::ok(const json& data) {
    return json{
        {"status", "ok"},
        {"data", data}
    };
}

json QueryService::err(int code, const std::string& message) {
    return json{
        {"status", "error"},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

template <typename Fn>
QueryService::Reply QueryService::guarded(Fn&& fn) const {
    try {
        return Reply{200, ok(fn())};
    } catch (const std::invalid_argument& e) {
        return Reply{400, err(400, e.what())};
    } catch (const std::out_of_range& e) {
        return Reply{404, err(404, e.what())};
    } catch (const std::exception& e) {
        std::cerr << "QueryService: request failed: " << e.what() << "\n";
        return Reply{500, err(500, e.what())};
    }
}

QueryService::Reply QueryService::health() const {
    auto snap = engine_.snapshot();
    return Reply{200, ok(json{
        {"docs", snap->names.size()},
        {"terms", snap->inverted.termCount()},
        {"generation", snap->generation}
    })};
}

QueryService::Reply QueryService::addDocuments(const json& body) {
    auto reply = guarded([&]() {
        std::vector<std::pair<std::string, std::string>> batch;
        auto addOne = [&batch](const json& doc) {
            if (!doc.is_object()) throw BadRequest("Document must be an object");
            auto name = doc.value("name", "");
            if (name.empty()) throw BadRequest("Missing document name");
            if (!doc.contains("text") || !doc.at("text").is_string()) {
                throw BadRequest("Missing document text for " + name);
            }
            batch.emplace_back(name, doc.at("text").get<std::string>());
        };

        std::size_t added = 0;
        if (body.is_array()) {
            for (const auto& doc : body) {
                addOne(doc);
                ++added;
            }
        } else {
            addOne(body);
            added = 1;
        }
        engine_.addDocuments(batch);
        return json{{"added", added}, {"docs", engine_.documentCount()}};
    });
    if (reply.status == 200) reply.status = 201;
    return reply;
}

QueryService::Reply QueryService::search(const std::string& mode, const Params& params) const {
    return guarded([&]() -> json {
        const auto limit = limitOf(params);
        // Ids and names must come from the same generation
        auto snap = engine_.snapshot();
        if (mode == "and") {
            return {{"hits", docHits(*snap, engine_.queryAnd(*snap, required(params, "q"), limit))}};
        }
        if (mode == "or") {
            return {{"hits", docHits(*snap, engine_.queryOr(*snap, required(params, "q"), limit))}};
        }
        if (mode == "wildcard") {
            const auto& pattern = required(params, "q");
            return {
                {"terms", engine_.wildcardTerms(*snap, pattern)},
                {"hits", docHits(*snap, engine_.queryWildcard(*snap, pattern, limit))}
            };
        }
        if (mode == "phrase") {
            return {{"hits", proximityHits(*snap, engine_.queryPhrase(*snap, required(params, "q"), limit))}};
        }
        if (mode == "proximity") {
            long long k = numeric(params, "k", 1);
            if (k < 0 || k > static_cast<long long>(std::numeric_limits<uint32_t>::max())) throw BadRequest("Parameter 'k' out of range");
            auto matches = engine_.queryProximity(*snap, required(params, "t1"), required(params, "t2"),
                                                  static_cast<uint32_t>(k), limit);
            return {{"hits", proximityHits(*snap, matches)}};
        }
        throw BadRequest("Unknown search mode: " + mode);
    });
}

QueryService::Reply QueryService::suggest(const Params& params) const {
    return guarded([&]() -> json {
        long long maxDistance = numeric(params, "max", 2);
        if (maxDistance < 0 || maxDistance > 16) throw BadRequest("Parameter 'max' out of range");
        json out = json::array();
        for (const auto& s : engine_.suggest(required(params, "q"), static_cast<int>(maxDistance))) {
            out.push_back({{"term", s.term}, {"distance", s.distance}});
        }
        return {{"suggestions", out}};
    });
}

QueryService::Reply QueryService::postings(const std::string& term) const {
    return guarded([&]() -> json {
        auto ids = engine_.postings(term);
        return {{"term", term}, {"ids", ids}, {"gaps", algo::valuesToGaps(ids)}};
    });
}

QueryService::Reply QueryService::distance(const Params& params) const {
    return guarded([&]() -> json {
        const auto& source = param(params, "source");
        const auto& dest = param(params, "dest");
        algo::EditDistanceTable<char> table(std::vector<char>(source.begin(), source.end()),
                                            std::vector<char>(dest.begin(), dest.end()));
        json ops = json::array();
        for (const auto& op : table.alignment()) {
            ops.push_back({
                {"source", op.source ? json(std::string(1, *op.source)) : json(nullptr)},
                {"dest", op.dest ? json(std::string(1, *op.dest)) : json(nullptr)}
            });
        }
        return {{"distance", table.distance()}, {"alignment", ops}};
    });
}

} // namespace miniretrieval
