#include "respkv/net/stream.hpp"

#include <gtest/gtest.h>

#include <string>

#include "respkv/net/errors.hpp"
#include "support/memory_stream.hpp"

namespace respkv::net::test {

using respkv::test::MemoryStream;

TEST(StreamReaderTest, ReadLineStripsCRLF) {
    MemoryStream stream("hello\r\nworld\n");
    StreamReader reader(stream);
    EXPECT_EQ(reader.read_line(), "hello");
    EXPECT_EQ(reader.read_line(), "world");
    EXPECT_FALSE(reader.read_line().has_value());
}

TEST(StreamReaderTest, ReadLineAcrossChunks) {
    MemoryStream stream("a long line split into single bytes\r\nnext\r\n", 1);
    StreamReader reader(stream);
    EXPECT_EQ(reader.read_line(), "a long line split into single bytes");
    EXPECT_EQ(reader.read_line(), "next");
}

TEST(StreamReaderTest, ReadLineWithoutTerminatorAtEof) {
    MemoryStream stream("partial");
    StreamReader reader(stream);
    EXPECT_FALSE(reader.read_line().has_value());
}

TEST(StreamReaderTest, ReadLineAtLimit) {
    MemoryStream stream(std::string(16, 'x') + "\r\n", 3);
    StreamReader reader(stream, 16);
    EXPECT_EQ(reader.read_line(), std::string(16, 'x'));
}

TEST(StreamReaderTest, UnterminatedLineOverLimitThrows) {
    // never sends a newline; must fail well before the input runs out
    MemoryStream stream(std::string(1024 * 1024, 'x'));
    StreamReader reader(stream, 1024);
    EXPECT_THROW((void)reader.read_line(), ProtocolError);
}

TEST(StreamReaderTest, TerminatedLineOverLimitThrows) {
    MemoryStream stream(std::string(17, 'x') + "\r\nnext\r\n");
    StreamReader reader(stream, 16);
    EXPECT_THROW((void)reader.read_line(), ProtocolError);
    EXPECT_EQ(reader.read_line(), "next");
}

TEST(StreamReaderTest, ReadExact) {
    MemoryStream stream("abcdef", 2);
    StreamReader reader(stream);
    EXPECT_EQ(reader.read_exact(3), "abc");
    EXPECT_EQ(reader.read_byte(), 'd');
    EXPECT_FALSE(reader.read_exact(3).has_value());
}

TEST(StreamReaderTest, ReadByteAtEof) {
    MemoryStream stream("");
    StreamReader reader(stream);
    EXPECT_FALSE(reader.read_byte().has_value());
}

TEST(StreamReaderTest, ReadExactKeepsEmbeddedNewlines) {
    MemoryStream stream("a\r\nb\r\n");
    StreamReader reader(stream);
    EXPECT_EQ(reader.read_exact(4), "a\r\nb");
}

}  // namespace respkv::net::test
