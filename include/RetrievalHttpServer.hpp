#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "Retrieval.hpp"
#include "miniretrieval/Config.hpp"
#include "miniretrieval/QueryService.hpp"

class RetrievalHttpServer {
public:
    explicit RetrievalHttpServer(const miniretrieval::ServerConfig& config);
    void run();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    miniretrieval::Retrieval engine_;
    miniretrieval::QueryService service_;
    std::chrono::steady_clock::time_point startTime_;
};
