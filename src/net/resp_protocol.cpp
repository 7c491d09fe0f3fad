#include "respkv/net/resp_protocol.hpp"

#include <algorithm>
#include <charconv>

#include "respkv/net/errors.hpp"

namespace respkv::net {

using core::Value;

namespace {

constexpr std::string_view kCRLF = "\r\n";

int64_t parse_integer(const std::string& line) {
    const char* begin = line.data();
    const char* end = begin + line.size();
    // from_chars accepts a leading '-' but not '+'
    if (begin != end && *begin == '+') {
        ++begin;
        if (begin != end && *begin == '-') {
            throw ProtocolError("invalid integer: '" + line + "'");
        }
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        throw ProtocolError("invalid integer: '" + line + "'");
    }
    return value;
}

class Decoder {
   public:
    explicit Decoder(StreamReader& reader) : reader_(reader) {}

    Value decode_message() {
        auto tag = reader_.read_byte();
        if (!tag) {
            throw Disconnect();
        }
        return decode_tagged(*tag, 0);
    }

   private:
    // nested elements: EOF here means the message was cut short
    Value decode_element(int depth) {
        auto tag = reader_.read_byte();
        if (!tag) {
            throw ProtocolError("unexpected end of stream");
        }
        return decode_tagged(*tag, depth);
    }

    Value decode_tagged(char tag, int depth) {
        switch (tag) {
            case '+':
                return Value::simple_string(read_line());
            case '-':
                return Value::error(read_line());
            case ':':
                return Value::integer(parse_integer(read_line()));
            case '$':
                return decode_bulk_string();
            case '*':
                return decode_array(depth + 1);
            case '%':
                return decode_map(depth + 1);
            default:
                throw CommandError("bad request");
        }
    }

    std::string read_line() {
        auto line = reader_.read_line();
        if (!line) {
            throw ProtocolError("unexpected end of stream");
        }
        return std::move(*line);
    }

    Value decode_bulk_string() {
        int64_t length = parse_integer(read_line());
        if (length == -1) {
            return Value::null();
        }
        if (length < -1) {
            throw ProtocolError("invalid bulk length: " + std::to_string(length));
        }
        if (length > RespProtocol::kMaxBulkLength) {
            throw ProtocolError("bulk length exceeds limit: " + std::to_string(length));
        }

        // payload plus its trailing CRLF
        auto data = reader_.read_exact(static_cast<std::size_t>(length) + kCRLF.size());
        if (!data) {
            throw ProtocolError("unexpected end of stream");
        }
        if (std::string_view(*data).substr(static_cast<std::size_t>(length)) != kCRLF) {
            throw ProtocolError("bulk string not terminated by CRLF");
        }
        data->resize(static_cast<std::size_t>(length));
        return Value::bulk_string(std::move(*data));
    }

    // a non-positive count yields an empty container
    int64_t read_count(int depth) {
        if (depth > RespProtocol::kMaxNestingDepth) {
            throw ProtocolError("nesting too deep");
        }
        return std::max<int64_t>(parse_integer(read_line()), 0);
    }

    Value decode_array(int depth) {
        int64_t count = read_count(depth);
        core::Array items;
        // the count comes off the wire, don't let it size the allocation
        items.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
        for (int64_t i = 0; i < count; ++i) {
            items.push_back(decode_element(depth));
        }
        return Value::array(std::move(items));
    }

    Value decode_map(int depth) {
        int64_t count = read_count(depth);
        core::Map pairs;
        pairs.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
        for (int64_t i = 0; i < count; ++i) {
            Value key = decode_element(depth);
            Value value = decode_element(depth);
            pairs.emplace_back(std::move(key), std::move(value));
        }
        return Value::map(std::move(pairs));
    }

    StreamReader& reader_;
};

// one case per Value alternative; adding an alternative breaks the build here
struct Encoder {
    std::string& out;

    void operator()(const core::Null&) const {
        out += "$-1\r\n";
    }

    void operator()(const core::SimpleString& s) const {
        bulk(s.data);
    }

    void operator()(const core::Error& e) const {
        // an embedded CR or LF would end the line early and desync the peer
        std::string message = e.message;
        std::replace(message.begin(), message.end(), '\r', ' ');
        std::replace(message.begin(), message.end(), '\n', ' ');
        out += '-';
        out += message;
        out += kCRLF;
    }

    void operator()(int64_t i) const {
        out += ':';
        out += std::to_string(i);
        out += kCRLF;
    }

    void operator()(const core::BulkString& s) const {
        bulk(s.data);
    }

    void operator()(const core::Array& items) const {
        out += '*';
        out += std::to_string(items.size());
        out += kCRLF;
        for (const auto& item : items) {
            RespProtocol::encode_to(out, item);
        }
    }

    void operator()(const core::Map& pairs) const {
        out += '%';
        out += std::to_string(pairs.size());
        out += kCRLF;
        for (const auto& [key, value] : pairs) {
            RespProtocol::encode_to(out, key);
            RespProtocol::encode_to(out, value);
        }
    }

    void bulk(const std::string& data) const {
        out += '$';
        out += std::to_string(data.size());
        out += kCRLF;
        out += data;
        out += kCRLF;
    }
};

}  // namespace

Value RespProtocol::decode(StreamReader& reader) {
    return Decoder(reader).decode_message();
}

std::string RespProtocol::encode(const Value& value) {
    std::string out;
    encode_to(out, value);
    return out;
}

void RespProtocol::encode_to(std::string& out, const Value& value) {
    // only reachable if an assignment into the variant threw halfway through
    if (value.storage().valueless_by_exception()) {
        throw CommandError("unrecognized type");
    }
    std::visit(Encoder{out}, value.storage());
}

void RespProtocol::write(IStream& stream, const Value& value) {
    stream.write_all(encode(value));
}

}  // namespace respkv::net
