#include <gtest/gtest.h>

#include "json_codec.hpp"
#include "protocol.hpp"
#include "tcp_client.hpp"
#include "test_helpers.hpp"

#include <fcntl.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <utility>

namespace {

coord::net::Endpoint loopback(uint16_t port) {
    coord::net::Endpoint endpoint;
    endpoint.address = "127.0.0.1";
    endpoint.port = port;
    return endpoint;
}

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

TEST(TcpClient, ConnectToClosedPortIsRefused) {
    coord::net::TcpClient client;
    try {
        client.connect("127.0.0.1", unused_port());
        FAIL() << "connect to a closed port succeeded";
    } catch (const coord::net::ConnectionError& exc) {
        EXPECT_EQ(exc.error_code(), ECONNREFUSED);
    }
    EXPECT_FALSE(client.is_open());
}

TEST(TcpClient, ExchangeWithClosedPortRaises) {
    EXPECT_THROW(coord::net::exchange(loopback(unused_port()), "{}"), coord::net::ConnectionError);
}

TEST(TcpClient, EchoPeerReturnsPayloadUnchanged) {
    LoopbackPeer peer(LoopbackPeer::Mode::Echo);
    auto payload = coord::codec::encode_envelope(
        coord::codec::make_add_dependencies(coord::codec::default_dependency_map()));

    auto response = coord::net::exchange(loopback(peer.port()), payload);

    EXPECT_EQ(response, payload);
    ASSERT_EQ(peer.requests().size(), 1u);
    EXPECT_EQ(peer.requests().front(), payload);
}

TEST(TcpClient, EchoPeerReturnsNonJsonBytesUnchanged) {
    LoopbackPeer peer(LoopbackPeer::Mode::Echo);
    std::string payload("raw\x01\x7f bytes", 11);

    EXPECT_EQ(coord::net::exchange(loopback(peer.port()), payload), payload);
}

TEST(TcpClient, ExchangeUsesOneConnectionAndOneRead) {
    LoopbackPeer peer(LoopbackPeer::Mode::Reply, {"ACK", "LATE"}, std::chrono::milliseconds(300));

    auto response = coord::net::exchange(loopback(peer.port()), R"({"id":"A"})");

    EXPECT_EQ(response, "ACK");
    EXPECT_EQ(peer.connections(), 1);
    EXPECT_EQ(peer.requests().size(), 1u);
}

TEST(TcpClient, ReplyIsCappedAtReceiveBufferSize) {
    LoopbackPeer peer(LoopbackPeer::Mode::Reply, {std::string(4 * coord::kReceiveBufferSize, 'x')});

    auto response = coord::net::exchange(loopback(peer.port()), "{}");

    EXPECT_FALSE(response.empty());
    EXPECT_LE(response.size(), coord::kReceiveBufferSize);
    EXPECT_EQ(response, std::string(response.size(), 'x'));
}

TEST(TcpClient, PeerClosingWithoutReplyYieldsEmptyResponse) {
    LoopbackPeer peer(LoopbackPeer::Mode::Reply);

    EXPECT_EQ(coord::net::exchange(loopback(peer.port()), "{}"), "");
}

TEST(TcpClient, SilentPeerTimesOut) {
    LoopbackPeer peer(LoopbackPeer::Mode::Silent);
    auto endpoint = loopback(peer.port());
    endpoint.receive_timeout = std::chrono::milliseconds(200);

    EXPECT_THROW(coord::net::exchange(endpoint, "{}"), coord::net::TimeoutError);
    EXPECT_EQ(peer.connections(), 1);
}

TEST(TcpClient, ClosedClientRejectsIo) {
    coord::net::TcpClient client;

    EXPECT_THROW(client.send_all("x"), coord::net::ConnectionError);
    EXPECT_THROW(client.receive_once(), coord::net::ConnectionError);
    EXPECT_THROW(client.set_receive_timeout(std::chrono::milliseconds(10)), coord::net::ConnectionError);
    client.close();
    client.close();
    EXPECT_FALSE(client.is_open());
}

TEST(TcpClient, MoveTransfersOwnership) {
    LoopbackPeer peer(LoopbackPeer::Mode::Silent);
    coord::net::TcpClient first;
    first.connect("127.0.0.1", peer.port());
    int fd = first.native_handle();

    coord::net::TcpClient second(std::move(first));

    EXPECT_FALSE(first.is_open());
    EXPECT_TRUE(second.is_open());
    EXPECT_EQ(second.native_handle(), fd);
}

TEST(TcpClient, DescriptorIsReleasedWhenClientGoesOutOfScope) {
    LoopbackPeer peer(LoopbackPeer::Mode::Silent);
    int fd = -1;
    {
        coord::net::TcpClient client;
        client.connect("localhost", peer.port());
        fd = client.native_handle();
        ASSERT_GE(fd, 0);
    }

    errno = 0;
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}
