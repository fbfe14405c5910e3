// vidstream/include/vidstream/server/Server.h
#ifndef VIDSTREAM_SERVER_SERVER_H
#define VIDSTREAM_SERVER_SERVER_H

#include "vidstream/server/Router.h"
#include "vidstream/server/ThreadPool.h"
#include "vidstream/net/Connection.h"
#include "vidstream/http/HttpRequest.h"
#include "vidstream/http/HttpResponse.h"

#include <string>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <mutex>
#include <thread>
#include <sys/epoll.h> // For epoll structures

namespace Vidstream {
namespace Server {

class Server {
private:
    int listen_fd_; // Listening socket file descriptor
    int epoll_fd_;  // Epoll instance file descriptor
    int bound_port_;
    std::atomic<bool> running_; // Flag to control server loop

    const Router& router_; // Built before the server, never modified while it runs
    std::unique_ptr<ThreadPool> thread_pool_;
    int idle_timeout_seconds_;
    int cleanup_interval_seconds_; // How often idle connections are swept

    // Map of active connections, indexed by their socket FD
    std::unordered_map<int, std::unique_ptr<Net::Connection>> connections_;
    std::mutex connections_mutex_; // Protects access to connections_ map

    static constexpr int MAX_EVENTS = 1024;
    static constexpr int BACKLOG = 1024; // Listen backlog for new connections

public:
    explicit Server(const Router& router,
                    size_t worker_threads = std::thread::hardware_concurrency(),
                    int idle_timeout_seconds = 60,
                    int cleanup_interval_seconds = 10);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and starts listening. Port 0 picks a free port; see port().
    bool listen(const std::string& host = "0.0.0.0", int port = 3000);

    // Event loop; returns after stop() once connections and workers are shut down
    void run();

    // Asks run() to return. Only flips an atomic flag, so it may be called
    // from a signal handler or another thread.
    void stop();

    int port() const { return bound_port_; }
    bool is_running() const { return running_; }

private:
    bool setup_socket(const std::string& host, int port);
    bool setup_epoll();
    void set_non_blocking(int fd);

    // Event handlers
    void handle_new_connection();
    void handle_client_data(int fd);
    void handle_write_ready(int fd);
    void close_connection(int fd);

    Net::Connection* find_connection(int fd);

    // Parses the next buffered request and hands it to a worker, or re-arms
    // the socket for more input when no complete request is buffered yet.
    void dispatch_next_request(int fd, Net::Connection* conn);
    Http::HttpResponse handle_request(Http::HttpRequest& request) const;
    bool rearm(int fd, uint32_t events);

    void cleanup_expired_connections();
    void shutdown();
};

} // namespace Server
} // namespace Vidstream

#endif // VIDSTREAM_SERVER_SERVER_H
