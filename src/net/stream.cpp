#include "respkv/net/stream.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "respkv/net/errors.hpp"

namespace respkv::net {

namespace {
constexpr std::size_t kChunkSize = 4096;
// once this much of the buffer has been consumed, drop the consumed prefix
constexpr std::size_t kCompactThreshold = 64 * 1024;
}  // namespace

bool StreamReader::fill() {
    if (pos_ == buffer_.size()) {
        buffer_.clear();
        pos_ = 0;
    } else if (pos_ >= kCompactThreshold) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }

    char chunk[kChunkSize];
    std::size_t n = stream_.read_some(chunk, sizeof(chunk));
    if (n == 0) {
        return false;
    }
    buffer_.append(chunk, n);
    return true;
}

std::optional<char> StreamReader::read_byte() {
    if (available() == 0 && !fill()) {
        return std::nullopt;
    }
    return buffer_[pos_++];
}

std::optional<std::string> StreamReader::read_line() {
    std::size_t scanned = pos_;
    while (true) {
        std::size_t nl = buffer_.find('\n', scanned);
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > max_line_length_) {
                throw ProtocolError("line exceeds limit of " + std::to_string(max_line_length_) +
                                    " bytes");
            }
            return line;
        }
        // fill() may compact the buffer, so remember the scan offset relative to pos_
        std::size_t offset = buffer_.size() - pos_;
        // one extra byte for a '\r' still waiting for its '\n'
        if (offset > max_line_length_ + 1) {
            pos_ = buffer_.size();
            throw ProtocolError("line exceeds limit of " + std::to_string(max_line_length_) +
                                " bytes");
        }
        if (!fill()) {
            return std::nullopt;
        }
        scanned = pos_ + offset;
    }
}

std::optional<std::string> StreamReader::read_exact(std::size_t n) {
    while (available() < n) {
        if (!fill()) {
            return std::nullopt;
        }
    }
    std::string data = buffer_.substr(pos_, n);
    pos_ += n;
    return data;
}

std::size_t SocketStream::read_some(char* buf, std::size_t len) {
    while (true) {
        ssize_t n = recv(fd_, buf, len, 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        throw TransportError("recv failed: " + std::string(strerror(errno)));
    }
}

void SocketStream::write_all(std::string_view data) {
    std::size_t total_sent = 0;
    while (total_sent < data.size()) {
        // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process with SIGPIPE
        ssize_t sent = send(fd_, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError("send failed: " + std::string(strerror(errno)));
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}

}  // namespace respkv::net
