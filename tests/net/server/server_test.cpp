#include "respkv/net/server/server.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "respkv/core/store.hpp"
#include "respkv/net/resp_protocol.hpp"
#include "respkv/net/stream.hpp"

namespace respkv::net::test {

using core::Value;

namespace {

// raw TCP peer: writes bytes exactly as given and decodes replies with the shared codec
class RawConnection {
   public:
    explicit RawConnection(uint16_t port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd_);
            fd_ = -1;
            return;
        }
        stream_ = std::make_unique<SocketStream>(fd_);
        reader_ = std::make_unique<StreamReader>(*stream_);
    }

    ~RawConnection() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    RawConnection(const RawConnection&) = delete;
    RawConnection& operator=(const RawConnection&) = delete;

    [[nodiscard]] bool ok() const {
        return fd_ >= 0;
    }

    void send_raw(const std::string& bytes) {
        stream_->write_all(bytes);
    }

    Value send(const std::vector<std::string>& words) {
        core::Array items;
        for (const auto& word : words) {
            items.push_back(Value::bulk_string(word));
        }
        RespProtocol::write(*stream_, Value::array(std::move(items)));
        return read_reply();
    }

    Value read_reply() {
        return RespProtocol::decode(*reader_);
    }

   private:
    int fd_ = -1;
    std::unique_ptr<SocketStream> stream_;
    std::unique_ptr<StreamReader> reader_;
};

}  // namespace

class ServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        store_ = std::make_unique<core::Store>();
        server::ServerOptions opts;
        opts.port = 0;  // ephemeral, so parallel test runs don't collide
        opts.max_connections = 16;
        server_ = std::make_unique<server::Server>(*store_, opts);
        server_->start();
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    std::unique_ptr<core::Store> store_;
    std::unique_ptr<server::Server> server_;
};

TEST_F(ServerTest, StartsOnEphemeralPort) {
    EXPECT_TRUE(server_->running());
    EXPECT_NE(server_->port(), 0);
}

TEST_F(ServerTest, SetAndGet) {
    RawConnection conn(server_->port());
    ASSERT_TRUE(conn.ok());

    EXPECT_EQ(conn.send({"SET", "foo", "bar"}), Value::integer(1));
    Value reply = conn.send({"GET", "foo"});
    EXPECT_EQ(reply.type(), core::ValueType::BulkString);
    EXPECT_EQ(reply.as_string(), "bar");
}

TEST_F(ServerTest, DeleteAndFlush) {
    RawConnection conn(server_->port());
    ASSERT_TRUE(conn.ok());

    EXPECT_EQ(conn.send({"DELETE", "foo"}), Value::integer(0));
    conn.send({"MSET", "a", "1", "b", "2"});
    EXPECT_EQ(conn.send({"DELETE", "a"}), Value::integer(1));
    EXPECT_TRUE(conn.send({"GET", "a"}).is_null());
    EXPECT_EQ(conn.send({"FLUSH"}), Value::integer(1));
    EXPECT_EQ(conn.send({"FLUSH"}), Value::integer(0));
}

TEST_F(ServerTest, BadRequestKeepsConnectionUsable) {
    RawConnection conn(server_->port());
    ASSERT_TRUE(conn.ok());

    conn.send_raw("?");
    Value reply = conn.read_reply();
    ASSERT_TRUE(reply.is_error());
    EXPECT_NE(reply.as_error().find("bad request"), std::string::npos);

    EXPECT_EQ(conn.send({"SET", "foo", "bar"}), Value::integer(1));
    EXPECT_EQ(conn.send({"GET", "foo"}), Value::bulk_string("bar"));
}

TEST_F(ServerTest, UnknownCommandReturnsError) {
    RawConnection conn(server_->port());
    ASSERT_TRUE(conn.ok());

    Value reply = conn.send({"INVALID"});
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.as_error(), "Unrecognized command: INVALID");
}

TEST_F(ServerTest, StoreSharedAcrossConnections) {
    RawConnection writer(server_->port());
    RawConnection reader(server_->port());
    ASSERT_TRUE(writer.ok());
    ASSERT_TRUE(reader.ok());

    writer.send({"SET", "shared", "value"});
    EXPECT_EQ(reader.send({"GET", "shared"}), Value::bulk_string("value"));
}

TEST_F(ServerTest, ConcurrentMsetBatchesLoseNothing) {
    constexpr int kClients = 8;
    constexpr int kBatches = 25;
    constexpr int kPairsPerBatch = 4;

    std::vector<std::thread> clients;
    std::vector<int> failures(kClients, 0);
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([this, c, &failures] {
            RawConnection conn(server_->port());
            if (!conn.ok()) {
                failures[c] = 1;
                return;
            }
            for (int b = 0; b < kBatches; ++b) {
                std::vector<std::string> words{"MSET"};
                for (int p = 0; p < kPairsPerBatch; ++p) {
                    words.push_back("c" + std::to_string(c) + "-b" + std::to_string(b) + "-p" +
                                    std::to_string(p));
                    words.push_back(std::to_string(p));
                }
                try {
                    if (conn.send(words) != Value::integer(kPairsPerBatch)) {
                        ++failures[c];
                    }
                } catch (const std::exception&) {
                    ++failures[c];
                    return;
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    for (int c = 0; c < kClients; ++c) {
        EXPECT_EQ(failures[c], 0) << "client " << c;
    }
    EXPECT_EQ(store_->size(), static_cast<std::size_t>(kClients * kBatches * kPairsPerBatch));
}

TEST_F(ServerTest, StopUnblocksIdleConnections) {
    RawConnection conn(server_->port());
    ASSERT_TRUE(conn.ok());
    EXPECT_EQ(conn.send({"SET", "k", "v"}), Value::integer(1));

    // the handler thread is now blocked reading the next request
    server_->stop();
    EXPECT_FALSE(server_->running());
    EXPECT_EQ(server_->active_connections(), 0u);
}

TEST_F(ServerTest, ConnectionsBeyondLimitWaitForFreeSlot) {
    server_->stop();

    server::ServerOptions opts;
    opts.port = 0;
    opts.max_connections = 1;
    server_ = std::make_unique<server::Server>(*store_, opts);
    server_->start();

    auto first = std::make_unique<RawConnection>(server_->port());
    ASSERT_TRUE(first->ok());
    EXPECT_EQ(first->send({"SET", "k", "v"}), Value::integer(1));

    // sits in the listen backlog until the first client leaves
    RawConnection second(server_->port());
    ASSERT_TRUE(second.ok());
    std::thread closer([&first] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        first.reset();
    });
    EXPECT_EQ(second.send({"GET", "k"}), Value::bulk_string("v"));
    closer.join();
}

TEST_F(ServerTest, SingleSlotHandsOverBetweenClients) {
    server_->stop();

    server::ServerOptions opts;
    opts.port = 0;
    opts.max_connections = 1;
    server_ = std::make_unique<server::Server>(*store_, opts);
    server_->start();

    constexpr int kClients = 50;
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kClients; ++i) {
        RawConnection conn(server_->port());
        ASSERT_TRUE(conn.ok());
        EXPECT_EQ(conn.send({"SET", "k" + std::to_string(i), "v"}), Value::integer(1));
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(store_->size(), static_cast<std::size_t>(kClients));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

}  // namespace respkv::net::test
