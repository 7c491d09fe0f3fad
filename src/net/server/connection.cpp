#include "respkv/net/server/connection.hpp"

#include <utility>

#include "respkv/net/errors.hpp"
#include "respkv/net/resp_protocol.hpp"
#include "respkv/util/logger.hpp"

namespace respkv::net::server {

using core::Value;

Connection::Connection(IStream& stream, Dispatcher& dispatcher, std::string peer)
    : stream_(stream), reader_(stream), dispatcher_(dispatcher), peer_(std::move(peer)) {}

void Connection::run() {
    State state = State::ReadRequest;
    try {
        while (state != State::Closed) {
            switch (state) {
                case State::ReadRequest:
                    state = read_request();
                    break;
                case State::Dispatch:
                    state = dispatch();
                    break;
                case State::WriteReply:
                    state = write_reply();
                    break;
                case State::Closed:
                    break;
            }
        }
    } catch (const TransportError& e) {
        LOG_WARN("Connection " + peer_ + " dropped: " + e.what());
    }
}

Connection::State Connection::read_request() {
    try {
        request_ = RespProtocol::decode(reader_);
        return State::Dispatch;
    } catch (const Disconnect&) {
        LOG_DEBUG("End of stream from " + peer_);
        return State::Closed;
    } catch (const TransportError&) {
        throw;
    } catch (const std::exception& e) {
        // malformed framing or unknown tag: answer it and keep the connection
        LOG_WARN("Request error from " + peer_ + ": " + e.what());
        reply_ = Value::error(e.what());
        return State::WriteReply;
    }
}

Connection::State Connection::dispatch() {
    try {
        reply_ = dispatcher_.dispatch(request_);
    } catch (const CommandError& e) {
        reply_ = Value::error(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Command failed for " + peer_ + ": " + e.what());
        reply_ = Value::error(std::string("internal error: ") + e.what());
    }
    return State::WriteReply;
}

Connection::State Connection::write_reply() {
    std::string encoded;
    try {
        encoded = RespProtocol::encode(reply_);
    } catch (const CommandError& e) {
        encoded = RespProtocol::encode(Value::error(e.what()));
    }
    stream_.write_all(encoded);
    ++replies_written_;
    return State::ReadRequest;
}

}  // namespace respkv::net::server
