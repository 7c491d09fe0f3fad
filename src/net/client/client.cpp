#include "respkv/net/client/client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "respkv/net/errors.hpp"
#include "respkv/net/resp_protocol.hpp"
#include "respkv/net/stream.hpp"

namespace respkv::net::client {

using core::Value;

namespace {

int64_t expect_integer(const Value& reply, const char* command) {
    if (!reply.is_integer()) {
        throw ProtocolError(std::string("unexpected reply to ") + command);
    }
    return reply.as_integer();
}

}  // namespace

class Client::Impl {
   public:
    explicit Impl(const ClientOptions& options) : options_(options) {}

    ~Impl() {
        disconnect();
    }

    void connect() {
        if (socket_fd_ >= 0) {
            return;
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw TransportError("failed to create socket: " + std::string(strerror(errno)));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::invalid_argument("Invalid address: " + options_.host);
        }

        // ::connect is the socket call. unqualified, the name would resolve to Impl::connect
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            // grab errno before close() can overwrite it
            std::string reason = strerror(errno);
            close(fd);
            throw TransportError("failed to connect to " + options_.host + ":" +
                                 std::to_string(options_.port) + ": " + reason);
        }

        socket_fd_ = fd;
        stream_ = std::make_unique<SocketStream>(fd);
        reader_ = std::make_unique<StreamReader>(*stream_);
    }

    void disconnect() {
        // reader_ refers to stream_, which refers to the fd: tear down in that order
        reader_.reset();
        stream_.reset();
        if (socket_fd_ >= 0) {
            close(socket_fd_);
            socket_fd_ = -1;
        }
    }

    [[nodiscard]] bool connected() const noexcept {
        return socket_fd_ >= 0;
    }

    Value execute(const std::vector<Value>& args) {
        if (socket_fd_ < 0) {
            throw TransportError("Not connected");
        }

        Value reply;
        try {
            RespProtocol::write(*stream_, Value::array(args));
            reply = RespProtocol::decode(*reader_);
        } catch (const TransportError&) {
            disconnect();
            throw;
        } catch (const Disconnect&) {
            disconnect();
            throw;
        }

        if (reply.is_error()) {
            throw CommandError(reply.as_error());
        }
        return reply;
    }

   private:
    ClientOptions options_;
    int socket_fd_ = -1;
    std::unique_ptr<SocketStream> stream_;
    std::unique_ptr<StreamReader> reader_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options) : impl_(std::make_unique<Impl>(options)) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

void Client::connect() {
    impl_->connect();
}

void Client::disconnect() {
    impl_->disconnect();
}

bool Client::connected() const noexcept {
    return impl_->connected();
}

Value Client::execute(const std::vector<Value>& args) {
    return impl_->execute(args);
}

Value Client::execute(const std::vector<std::string>& args) {
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        values.push_back(Value::bulk_string(arg));
    }
    return impl_->execute(values);
}

Value Client::get(std::string_view key) {
    return execute(std::vector<std::string>{"GET", std::string(key)});
}

int64_t Client::set(std::string_view key, std::string_view value) {
    Value reply = execute(std::vector<std::string>{"SET", std::string(key), std::string(value)});
    return expect_integer(reply, "SET");
}

int64_t Client::remove(std::string_view key) {
    return expect_integer(execute(std::vector<std::string>{"DELETE", std::string(key)}), "DELETE");
}

int64_t Client::flush() {
    return expect_integer(execute(std::vector<std::string>{"FLUSH"}), "FLUSH");
}

core::Array Client::mget(const std::vector<std::string>& keys) {
    std::vector<std::string> args{"MGET"};
    args.insert(args.end(), keys.begin(), keys.end());
    Value reply = execute(args);
    if (!reply.is_array()) {
        throw ProtocolError("unexpected reply to MGET");
    }
    return reply.as_array();
}

int64_t Client::mset(const std::vector<std::pair<std::string, std::string>>& pairs) {
    std::vector<std::string> args{"MSET"};
    for (const auto& [key, value] : pairs) {
        args.push_back(key);
        args.push_back(value);
    }
    return expect_integer(execute(args), "MSET");
}

}  // namespace respkv::net::client
