#ifndef RESPKV_NET_RESP_PROTOCOL_HPP
#define RESPKV_NET_RESP_PROTOCOL_HPP

#include <cstdint>
#include <string>

#include "respkv/core/value.hpp"
#include "respkv/net/stream.hpp"

namespace respkv::net {

/*
    wire format: one tag byte, then a CRLF terminated header, then (for containers and bulk
    strings) the payload.

        +<bytes>\r\n                 simple string
        -<message>\r\n               error
        :<int>\r\n                   integer
        $<len>\r\n<bytes>\r\n        bulk string, $-1\r\n is null
        *<count>\r\n<values...>      array
        %<pairs>\r\n<k v k v ...>    map

    both directions use the same framing, so server and client share this codec.
*/
class RespProtocol {
   public:
    static constexpr int kMaxNestingDepth = 512;
    static constexpr int64_t kMaxBulkLength = 512LL * 1024 * 1024;

    /*
        read exactly one complete value starting at the next tag byte.
        throws:
            Disconnect      - stream at EOF before the tag byte
            CommandError    - unknown tag byte ("bad request")
            ProtocolError   - bad length/integer, or EOF in the middle of a value
    */
    static core::Value decode(StreamReader& reader);

    // serialize a value. both string kinds go out as bulk strings
    static std::string encode(const core::Value& value);
    static void encode_to(std::string& out, const core::Value& value);

    // encode and write in a single write_all call
    static void write(IStream& stream, const core::Value& value);
};

}  // namespace respkv::net

#endif
