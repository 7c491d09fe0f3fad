#ifndef RESPKV_NET_CLIENT_CLIENT_HPP
#define RESPKV_NET_CLIENT_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "respkv/core/value.hpp"

namespace respkv::net::client {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 31337;
};

/*
    blocking client over one persistent connection. requests go out as arrays of bulk strings.
    errors:
        - an error reply throws CommandError with the server's message
        - a failed or closed connection throws TransportError / Disconnect and marks the
          client disconnected
*/
class Client {
   public:
    explicit Client(const ClientOptions& options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void disconnect();
    [[nodiscard]] bool connected() const noexcept;

    // send one request, return the reply
    core::Value execute(const std::vector<core::Value>& args);
    core::Value execute(const std::vector<std::string>& args);

    // null if the key is absent
    [[nodiscard]] core::Value get(std::string_view key);
    int64_t set(std::string_view key, std::string_view value);
    // 1 if the key existed, 0 otherwise
    int64_t remove(std::string_view key);
    // number of keys removed
    int64_t flush();
    [[nodiscard]] core::Array mget(const std::vector<std::string>& keys);
    int64_t mset(const std::vector<std::pair<std::string, std::string>>& pairs);

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::net::client

#endif
