#include "respkv/net/server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "respkv/net/server/connection.hpp"
#include "respkv/net/server/dispatcher.hpp"
#include "respkv/net/stream.hpp"
#include "respkv/util/logger.hpp"

namespace respkv::net::server {

namespace {

/*
    writing to a socket whose peer has closed raises SIGPIPE, and the default action terminates
    the process. ignore it once at startup; sends also pass MSG_NOSIGNAL (see SocketStream)
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

static SigpipeIgnorer sigpipe_ignorer;

std::string peer_name(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

class Server::Impl {
   public:
    Impl(core::IStore& store, const ServerOptions& options)
        : options_(options), dispatcher_(store) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        // AF_INET = IPv4, SOCK_STREAM = TCP
        // returns a file descriptor (integer handle), negative means error
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            // note: errno is only valid right after the failed call. read it before anything
            // else (even a log line) can overwrite it
            throw std::runtime_error("failed to create socket: " + std::string(strerror(errno)));
        }

        // SO_REUSEADDR lets us rebind right after a restart instead of waiting out TIME_WAIT
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
        }

        // htons converts the port to network byte order (big-endian)
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        // before bind the socket has no address, so the OS has nowhere to route packets to it
        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to bind to port " + std::to_string(options_.port) +
                                     ": " + std::string(strerror(errno)));
        }

        // query actual bound port (for options_.port is 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = options_.port;
        }

        // SOMAXCONN is the max backlog of pending connections. while the pool is full, new
        // clients wait there (accept_loop stops calling accept)
        if (listen(fd, SOMAXCONN) < 0) {
            close(fd);
            throw std::runtime_error("failed to listen: " + std::string(strerror(errno)));
        }

        server_fd_.store(fd);
        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        LOG_INFO("Server started on " + options_.host + ":" + std::to_string(actual_port_) +
                 " (max " + std::to_string(options_.max_connections) + " connections)");
    }

    void stop() {
        // exchange stores false and returns the old value: only the first caller gets past here
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Server stopping...");

        // shutdown unblocks the accept thread, close releases the fd
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        /*
            client threads sit in recv() with no timeout. shutting their sockets down makes recv
            return 0, the connection sees a Disconnect and the thread finishes.
            join outside the lock: a finishing thread takes clients_mutex_ to release its fd.
        */
        std::vector<std::unique_ptr<ClientInfo>> clients;
        {
            std::lock_guard lock(clients_mutex_);
            for (auto& info : clients_) {
                if (info->fd >= 0) {
                    shutdown(info->fd, SHUT_RDWR);
                }
            }
            clients.swap(clients_);
        }
        for (auto& info : clients) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }

        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

    [[nodiscard]] std::size_t active_connections() {
        std::lock_guard lock(clients_mutex_);
        std::size_t active = 0;
        for (const auto& info : clients_) {
            if (!info->finished.load()) {
                ++active;
            }
        }
        return active;
    }

   private:
    struct ClientInfo {
        std::thread thread;
        // -1 once the handler closed it. guarded by clients_mutex_
        int fd = -1;
        std::atomic<bool> finished{false};
    };

    void accept_loop() {
        while (running_) {
            cleanup_finished_clients();

            // pool is full: leave pending connections in the backlog.
            // sleep unlocked, a finishing handler needs clients_mutex_ to give up its slot
            bool full = false;
            {
                std::lock_guard lock(clients_mutex_);
                full = clients_.size() >= options_.max_connections;
            }
            if (full) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            int fd = server_fd_.load();
            if (fd < 0) {
                break;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

            if (client_fd < 0) {
                if (running_ && errno != EINTR) {
                    LOG_ERROR("Accept failed: " + std::string(strerror(errno)));
                }
                continue;
            }

            std::string peer = peer_name(client_addr);
            LOG_INFO("Connection received: " + peer);

            {
                std::lock_guard lock(clients_mutex_);
                auto info = std::make_unique<ClientInfo>();
                info->fd = client_fd;
                // heap allocated so the address stays stable while clients_ reallocates
                auto* info_ptr = info.get();
                // handle_client is a member function, so 'this' goes in as its implicit first arg
                info->thread = std::thread(&Impl::handle_client, this, client_fd, peer, info_ptr);
                clients_.push_back(std::move(info));
            }
        }
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void handle_client(int client_fd, std::string peer, ClientInfo* info) {
        try {
            SocketStream stream(client_fd);
            Connection connection(stream, dispatcher_, peer);
            connection.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Client handler error (" + peer + "): " + e.what());
        }

        {
            std::lock_guard lock(clients_mutex_);
            info->fd = -1;
            close(client_fd);
        }
        info->finished.store(true);
        LOG_INFO("Client disconnected: " + peer);
    }

    ServerOptions options_;
    Dispatcher dispatcher_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::vector<std::unique_ptr<ClientInfo>> clients_;
    std::mutex clients_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(core::IStore& store, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(store, options)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}
std::size_t Server::active_connections() const {
    return impl_->active_connections();
}

}  // namespace respkv::net::server
