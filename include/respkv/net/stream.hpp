#ifndef RESPKV_NET_STREAM_HPP
#define RESPKV_NET_STREAM_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace respkv::net {

// byte transport underneath the codec. sockets in production, memory buffers in tests
class IStream {
   public:
    virtual ~IStream() = default;

    // read up to len bytes into buf. returns 0 on orderly EOF, throws TransportError on failure
    [[nodiscard]] virtual std::size_t read_some(char* buf, std::size_t len) = 0;
    // write every byte or throw TransportError
    virtual void write_all(std::string_view data) = 0;
};

/*
    buffered reads on top of an IStream. all reads block until enough bytes arrived and return
    nullopt if the stream hit EOF first (bytes read before EOF are lost, the message is broken
    anyway).
*/
class StreamReader {
   public:
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    explicit StreamReader(IStream& stream, std::size_t max_line_length = kMaxLineLength)
        : stream_(stream), max_line_length_(max_line_length) {}

    [[nodiscard]] std::optional<char> read_byte();
    // up to and excluding '\n'. a '\r' right before it is dropped too.
    // throws ProtocolError once a line outgrows max_line_length, dropping what was buffered of it
    [[nodiscard]] std::optional<std::string> read_line();
    [[nodiscard]] std::optional<std::string> read_exact(std::size_t n);

   private:
    // pull one chunk from the stream. false on EOF
    bool fill();
    [[nodiscard]] std::size_t available() const noexcept {
        return buffer_.size() - pos_;
    }

    IStream& stream_;
    std::size_t max_line_length_;
    std::string buffer_;
    std::size_t pos_ = 0;
};

// IStream over a connected socket. does not own the fd
class SocketStream : public IStream {
   public:
    explicit SocketStream(int fd) : fd_(fd) {}

    [[nodiscard]] std::size_t read_some(char* buf, std::size_t len) override;
    void write_all(std::string_view data) override;

   private:
    int fd_;
};

}  // namespace respkv::net

#endif
