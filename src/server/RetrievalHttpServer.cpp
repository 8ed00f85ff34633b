#include "RetrievalHttpServer.hpp"

#include <iostream>

using json = nlohmann::json;
using miniretrieval::QueryService;

namespace {

QueryService::Params paramsOf(const httplib::Request& req) {
    QueryService::Params params;
    for (const auto& kv : req.params) {
        params.emplace(kv.first, kv.second);
    }
    return params;
}

void addCors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void send(httplib::Response& res, const QueryService::Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
    addCors(res);
}

} // namespace

RetrievalHttpServer::RetrievalHttpServer(const miniretrieval::ServerConfig& config)
    : host_(config.host), port_(config.port), engine_(config), service_(engine_),
      startTime_(std::chrono::steady_clock::now()) {
    try {
        engine_.loadDirectory(config.documentDir, config.documentExtension);
    } catch (const std::exception& e) {
        std::cerr << "RetrievalHttpServer: " << e.what() << "; starting with an empty library\n";
    }
    setupRoutes();
}

void RetrievalHttpServer::run() {
    std::cout << "Retrieval HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("cannot listen on " + host_ + ":" + std::to_string(port_));
    }
}

void RetrievalHttpServer::setupRoutes() {

    // JSON content checker
    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this](const httplib::Request&, httplib::Response& res) {
        auto reply = service_.health();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();
        reply.body["data"]["uptimeSeconds"] = uptime;
        send(res, reply);
    });

    // --- ADD DOCUMENTS ---
    server_.Post("/v1/documents", [this, isJsonContent](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            send(res, {415, QueryService::err(415, "Content-Type must be application/json")});
            return;
        }
        auto body = json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            send(res, {400, QueryService::err(400, "Invalid JSON")});
            return;
        }
        send(res, service_.addDocuments(body));
    });

    // --- SEARCH (and | or | phrase | wildcard | proximity) ---
    server_.Get(R"(/v1/search/([a-z]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.search(req.matches[1], paramsOf(req)));
    });

    // --- TERM SUGGESTIONS ---
    server_.Get("/v1/terms/suggest", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.suggest(paramsOf(req)));
    });

    // --- POSTINGS AS BINARY BLOCK ---
    server_.Get(R"(/v1/postings/([^/]+)/block)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            auto block = engine_.encodedPostings(req.matches[1]);
            res.set_content(block, "application/octet-stream");
        } catch (const std::exception& e) {
            std::cerr << "RetrievalHttpServer: posting block failed: " << e.what() << "\n";
            res.status = 500;
            res.set_content(QueryService::err(500, e.what()).dump(), "application/json");
        }
        addCors(res);
    });

    // --- POSTINGS AS JSON ---
    server_.Get(R"(/v1/postings/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.postings(req.matches[1]));
    });

    // --- EDIT DISTANCE ---
    server_.Get("/v1/distance", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.distance(paramsOf(req)));
    });
}
