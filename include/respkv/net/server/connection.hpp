#ifndef RESPKV_NET_SERVER_CONNECTION_HPP
#define RESPKV_NET_SERVER_CONNECTION_HPP

#include <cstddef>
#include <string>

#include "respkv/net/server/dispatcher.hpp"
#include "respkv/net/stream.hpp"

namespace respkv::net::server {

/*
    per-connection request/response loop:

        ReadRequest -> Dispatch -> WriteReply -> ReadRequest ...
             |
             +-> Closed   (peer disconnected, or the transport failed)

    a request that fails to decode skips Dispatch and goes straight to WriteReply with an
    error value. exactly one reply is written per request, in arrival order.
*/
class Connection {
   public:
    enum class State {
        ReadRequest,
        Dispatch,
        WriteReply,
        Closed,
    };

    // peer is only used in log lines
    Connection(IStream& stream, Dispatcher& dispatcher, std::string peer);

    // blocks until the peer goes away. transport failures are logged, not thrown
    void run();

    [[nodiscard]] std::size_t replies_written() const noexcept {
        return replies_written_;
    }

   private:
    State read_request();
    State dispatch();
    State write_reply();

    IStream& stream_;
    StreamReader reader_;
    Dispatcher& dispatcher_;
    std::string peer_;

    core::Value request_;
    core::Value reply_;
    std::size_t replies_written_ = 0;
};

}  // namespace respkv::net::server

#endif
