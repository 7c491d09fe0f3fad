#ifndef RESPKV_NET_SERVER_SERVER_HPP
#define RESPKV_NET_SERVER_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "respkv/core/istore.hpp"

namespace respkv::net::server {

struct ServerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 31337;  // 0 picks an ephemeral port, read it back with port()
    std::size_t max_connections = 64;
};

/*
    TCP listener. one accept thread plus one thread per live connection, at most
    max_connections of them. at the cap the accept loop stops accepting, so extra clients wait
    in the kernel backlog until a slot frees up.
*/
class Server {
   public:
    Server(core::IStore& store, const ServerOptions& options = {});
    ~Server();
    /*
        note on copy&moves:
        - server owns Impl which has threads & mutex and socket fds under the hood
        - copying is not safe
        - moving the unique_ptr<Impl> is trivial, so moves are allowed
    */
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // bind + listen + spawn the accept thread. throws std::runtime_error on socket failures
    void start();
    // close the listener, shut down every client socket and join all threads
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] std::size_t active_connections() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::net::server

#endif
