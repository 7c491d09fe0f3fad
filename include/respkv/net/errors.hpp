#ifndef RESPKV_NET_ERRORS_HPP
#define RESPKV_NET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace respkv::net {

// malformed framing: bad length, bad integer, truncated message. answered with an error reply
class ProtocolError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// unknown command, bad request shape or arity, unknown tag byte. answered with an error reply
class CommandError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// peer closed the connection at a message boundary. ends the connection, no reply
class Disconnect : public std::runtime_error {
   public:
    Disconnect() : std::runtime_error("peer disconnected") {}
};

// socket level failure (recv/send returned an error). ends the connection
class TransportError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace respkv::net

#endif
