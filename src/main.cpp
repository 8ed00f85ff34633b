#include "RetrievalHttpServer.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        miniretrieval::ServerConfig config;
        if (argc > 1) {
            config = miniretrieval::ServerConfig::load(argv[1]);
        }
        RetrievalHttpServer app(config);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
