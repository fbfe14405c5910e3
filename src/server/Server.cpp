// vidstream/src/server/Server.cpp
#include "vidstream/server/Server.h"
#include <iostream>
#include <stdexcept>
#include <chrono>
#include <vector>
#include <fcntl.h>    // For fcntl
#include <unistd.h>   // For close
#include <sys/socket.h> // For socket, bind, listen, accept
#include <netinet/in.h> // For sockaddr_in
#include <arpa/inet.h>  // For inet_ntoa
#include <errno.h>
#include <cstring>    // For strerror

namespace Vidstream {
namespace Server {

Server::Server(const Router& router, size_t worker_threads, int idle_timeout_seconds,
               int cleanup_interval_seconds)
    : listen_fd_(-1), epoll_fd_(-1), bound_port_(0), running_(false),
      router_(router),
      thread_pool_(std::make_unique<ThreadPool>(worker_threads)),
      idle_timeout_seconds_(idle_timeout_seconds),
      cleanup_interval_seconds_(cleanup_interval_seconds) {}

Server::~Server() {
    stop();
    shutdown();
}

void Server::set_non_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        throw std::runtime_error("fcntl F_GETFL failed: " + std::string(strerror(errno)));
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw std::runtime_error("fcntl F_SETFL failed: " + std::string(strerror(errno)));
    }
}

bool Server::setup_socket(const std::string& host, int port) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        std::cerr << "Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "Failed to set SO_REUSEADDR: " << strerror(errno) << std::endl;
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    // Media clients keep connections open between range requests
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt)) < 0) {
        std::cerr << "Failed to set SO_KEEPALIVE: " << strerror(errno) << std::endl;
    }

    try {
        set_non_blocking(listen_fd_);
    } catch (const std::runtime_error& e) {
        std::cerr << "Failed to set listen socket non-blocking: " << e.what() << std::endl;
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &(addr.sin_addr)) <= 0) {
        std::cerr << "Invalid host address: " << host << std::endl;
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "Failed to bind socket to " << host << ":" << port << ": " << strerror(errno) << std::endl;
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (::listen(listen_fd_, BACKLOG) < 0) {
        std::cerr << "Failed to listen on socket: " << strerror(errno) << std::endl;
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    std::cout << "Server is listening on " << host << ":" << bound_port_ << std::endl;
    return true;
}

bool Server::setup_epoll() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::cerr << "Failed to create epoll instance: " << strerror(errno) << std::endl;
        return false;
    }

    epoll_event event{};
    event.events = EPOLLIN | EPOLLET; // Edge-triggered for listen socket
    event.data.fd = listen_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &event) < 0) {
        std::cerr << "Failed to add listen socket to epoll: " << strerror(errno) << std::endl;
        close(epoll_fd_);
        epoll_fd_ = -1;
        return false;
    }
    return true;
}

bool Server::listen(const std::string& host, int port) {
    if (!setup_socket(host, port)) {
        return false;
    }
    if (!setup_epoll()) {
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    running_ = true;
    return true;
}

void Server::run() {
    if (epoll_fd_ < 0) {
        std::cerr << "Server::run called before a successful listen()" << std::endl;
        return;
    }

    epoll_event events[MAX_EVENTS];
    auto last_cleanup = std::chrono::steady_clock::now();

    while (running_) {
        int num_events = epoll_wait(epoll_fd_, events, MAX_EVENTS, 1000); // 1-second timeout

        if (num_events < 0) {
            if (errno == EINTR) {
                continue; // Interrupted by signal
            }
            std::cerr << "epoll_wait failed: " << strerror(errno) << std::endl;
            running_ = false;
            break;
        }

        for (int i = 0; i < num_events; ++i) {
            int fd = events[i].data.fd;
            uint32_t event_flags = events[i].events;

            if (fd == listen_fd_) {
                if (event_flags & EPOLLIN) {
                    handle_new_connection();
                }
                continue;
            }

            if (event_flags & (EPOLLERR | EPOLLHUP)) {
                std::cerr << "Epoll error or hangup on fd " << fd << std::endl;
                close_connection(fd); // Drops any in-progress stream and its file
                continue;
            }
            if (event_flags & EPOLLIN) {
                handle_client_data(fd);
            } else if (event_flags & EPOLLOUT) {
                handle_write_ready(fd);
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_cleanup >= std::chrono::seconds(cleanup_interval_seconds_)) {
            cleanup_expired_connections();
            last_cleanup = now;
        }
    }

    std::cout << "Server main loop stopped." << std::endl;
    shutdown();
}

void Server::stop() {
    running_ = false;
}

void Server::shutdown() {
    bool was_open = listen_fd_ >= 0 || epoll_fd_ >= 0;

    thread_pool_->shutdown(); // Lets handlers already queued finish

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear(); // Connection destructors close sockets and files
    }

    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    if (was_open) {
        std::cout << "Server fully stopped." << std::endl;
    }
}

void Server::handle_new_connection() {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd;

    // Accept all pending connections in edge-triggered mode
    while ((client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len)) >= 0) {
        std::cout << "Accepted new connection from " << inet_ntoa(client_addr.sin_addr)
                  << ":" << ntohs(client_addr.sin_port) << " on fd " << client_fd << std::endl;

        try {
            set_non_blocking(client_fd);
        } catch (const std::runtime_error& e) {
            std::cerr << "Failed to set client socket non-blocking: " << e.what() << std::endl;
            close(client_fd);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[client_fd] = std::make_unique<Net::Connection>(client_fd);
        }

        epoll_event event{};
        event.events = EPOLLIN | EPOLLET | EPOLLONESHOT;
        event.data.fd = client_fd;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &event) < 0) {
            std::cerr << "Failed to add client socket to epoll: " << strerror(errno) << std::endl;
            close_connection(client_fd);
            continue;
        }
        client_len = sizeof(client_addr);
    }

    if (errno != EAGAIN && errno != EWOULDBLOCK) {
        std::cerr << "Error accepting connection: " << strerror(errno) << std::endl;
    }
}

Net::Connection* Server::find_connection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second.get(); // Ownership remains in the map
}

bool Server::rearm(int fd, uint32_t events) {
    epoll_event event{};
    event.events = events | EPOLLET | EPOLLONESHOT;
    event.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &event) < 0) {
        std::cerr << "Failed to modify epoll for fd " << fd << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

void Server::handle_client_data(int fd) {
    Net::Connection* conn_ptr = find_connection(fd);
    if (!conn_ptr) {
        std::cerr << "Error: handle_client_data called for non-existent FD " << fd << std::endl;
        return;
    }

    Net::IoStatus status = conn_ptr->read_data();
    if (status == Net::IoStatus::CLOSED) {
        std::cout << "Client on fd " << fd << " closed connection." << std::endl;
        close_connection(fd);
        return;
    }
    if (status == Net::IoStatus::ERROR) {
        close_connection(fd);
        return;
    }

    dispatch_next_request(fd, conn_ptr);
}

void Server::dispatch_next_request(int fd, Net::Connection* conn_ptr) {
    if (!conn_ptr->process_read_buffer()) {
        if (conn_ptr->parse_failed()) {
            close_connection(fd);
        } else if (!rearm(fd, EPOLLIN)) {
            close_connection(fd);
        }
        return;
    }

    Http::HttpRequest request = conn_ptr->take_request();
    conn_ptr->set_keep_alive(request.keep_alive());
    conn_ptr->in_flight_ = true;

    bool queued = thread_pool_->enqueue([this, fd, conn_ptr, request = std::move(request)]() mutable {
        Http::HttpResponse res = handle_request(request);
        conn_ptr->set_response_content(std::move(res));

        // in_flight_ stays set until the event loop picks up the write, so the
        // idle sweep cannot close the socket under this worker
        if (!rearm(fd, EPOLLOUT)) {
            close_connection(fd);
        }
    });

    if (!queued) {
        conn_ptr->in_flight_ = false;
        close_connection(fd);
    }
}

Http::HttpResponse Server::handle_request(Http::HttpRequest& request) const {
    std::cout << "Received request for " << Http::http_method_to_string(request.method())
              << " " << request.path() << std::endl;

    Http::HttpResponse res;
    std::optional<RouteMatch> match = router_.find_route(request.method(), request.path());

    if (match) {
        request.path_params_ = std::move(match->params);
        try {
            (*match->handler)(request, res);
        } catch (const std::exception& e) {
            std::cerr << "Handler exception for " << Http::http_method_to_string(request.method())
                      << " " << request.path() << ": " << e.what() << std::endl;
            Json::JsonValue error_json = Json::JsonValue::object();
            error_json["error"] = "Server error";
            res.reset();
            res.status(Http::HttpStatus::INTERNAL_SERVER_ERROR)
               .json(error_json)
               .header("Access-Control-Allow-Origin", "*");
        }
    } else {
        std::cerr << "No route found for " << Http::http_method_to_string(request.method())
                  << " " << request.path() << std::endl;
        res.not_found();
    }

    if (!request.keep_alive()) {
        res.header("Connection", "close");
    }
    return res;
}

void Server::handle_write_ready(int fd) {
    Net::Connection* conn_ptr = find_connection(fd);
    if (!conn_ptr) {
        std::cerr << "Error: handle_write_ready called for non-existent FD " << fd << std::endl;
        return;
    }
    conn_ptr->in_flight_ = false; // The worker is done with it

    Net::IoStatus status = conn_ptr->write_data();
    if (status == Net::IoStatus::ERROR || status == Net::IoStatus::CLOSED) {
        close_connection(fd);
        return;
    }

    if (conn_ptr->has_data_to_write()) {
        // One chunk per wake-up keeps a large download from starving other sockets
        if (!rearm(fd, EPOLLOUT)) {
            close_connection(fd);
        }
        return;
    }

    if (!conn_ptr->keep_alive()) {
        close_connection(fd);
        return;
    }

    conn_ptr->reset();
    dispatch_next_request(fd, conn_ptr); // A pipelined request may already be buffered
}

void Server::close_connection(int fd) {
    if (epoll_fd_ >= 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr); // Fails harmlessly if never added
    }

    std::unique_ptr<Net::Connection> conn_to_close;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(fd);
        if (it != connections_.end()) {
            conn_to_close = std::move(it->second);
            connections_.erase(it);
        }
    }

    if (conn_to_close) {
        conn_to_close->close_connection();
    } else {
        std::cerr << "Warning: Attempted to close non-existent connection FD " << fd << std::endl;
    }
}

void Server::cleanup_expired_connections() {
    auto now = std::chrono::steady_clock::now();
    std::vector<int> fds_to_close;

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& pair : connections_) {
            if (pair.second->in_flight_) {
                continue;
            }
            if (now - pair.second->get_last_activity() >= std::chrono::seconds(idle_timeout_seconds_)) {
                fds_to_close.push_back(pair.first);
            }
        }
    }

    for (int fd : fds_to_close) {
        std::cout << "Cleaning up expired connection on fd " << fd << std::endl;
        close_connection(fd);
    }
}

} // namespace Server
} // namespace Vidstream
