// src/main.cpp
#include "vidstream/Vidstream.h" // Include the convenience header

#include <iostream>
#include <signal.h>

// Global server instance for signal handling
Vidstream::Server::Server* g_server = nullptr;

void signal_handler(int signal) {
    if (g_server) {
        g_server->stop(); // Only flips the running flag; run() does the teardown
    }
    (void)signal;
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    try {
        Vidstream::Platform::ServerConfig config;
        if (argc == 2) {
            config = Vidstream::Platform::ServerConfig::load_file(argv[1]);
            std::cout << "Loaded configuration from " << argv[1] << std::endl;
        }
        config.apply_environment();
        config.validate();

        Vidstream::Catalog::VideoCatalog catalog(
            config.videos ? *config.videos : Vidstream::Catalog::VideoCatalog::default_videos(),
            config.media_root);
        std::cout << "Catalog has " << catalog.videos().size() << " video(s), media root "
                  << catalog.media_root() << std::endl;

        Vidstream::Media::ByteStreamResponder responder(config.stream_chunk_size);

        Vidstream::Server::Router router;
        Vidstream::App::register_media_routes(router, catalog, responder);

        // Create server instance
        Vidstream::Server::Server server(router, config.thread_pool_size, config.idle_timeout_seconds);
        g_server = &server; // Set global pointer for signal handling

        // Setup signal handlers
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        signal(SIGPIPE, SIG_IGN); // Peer resets surface as send() errors instead

        if (!server.listen(config.host, config.port)) {
            std::cerr << "Failed to start server on " << config.host << ":" << config.port << std::endl;
            g_server = nullptr;
            return 1;
        }

        server.run();
        g_server = nullptr;
        std::cout << "Shutting down..." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
