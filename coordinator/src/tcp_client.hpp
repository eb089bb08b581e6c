#pragma once

#include "protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace coord::net {

class ConnectionError : public std::runtime_error {
public:
    ConnectionError(const std::string& what, int error_code)
        : std::runtime_error(what), error_code_(error_code) {}

    /// errno captured when the socket call failed
    int error_code() const { return error_code_; }

private:
    int error_code_;
};

class TimeoutError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

struct Endpoint {
    std::string address = kDefaultAddress;
    uint16_t port = kDefaultPort;
    /// Bound on the single read; zero blocks until the peer answers.
    std::chrono::milliseconds receive_timeout{0};
};

/**
 * Blocking TCP stream owned for its whole lifetime.
 *
 * The descriptor is closed by the destructor, so every exit path between
 * connect() and the end of the scope releases it.
 */
class TcpClient {
public:
    TcpClient() = default;
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;
    TcpClient(TcpClient&& other) noexcept;
    TcpClient& operator=(TcpClient&& other) noexcept;

    /// Connect to host:port, trying every resolved address in order.
    void connect(const std::string& host, uint16_t port);

    void set_receive_timeout(std::chrono::milliseconds timeout);

    /// Write the whole buffer; short writes are continued, nothing is retried after an error.
    void send_all(const std::string& data);

    /// Exactly one read of up to max_bytes. Returns an empty string when the peer closed.
    std::string receive_once(std::size_t max_bytes = kReceiveBufferSize);

    void close();

    bool is_open() const { return fd_ >= 0; }
    int native_handle() const { return fd_; }

private:
    int fd_ = -1;
};

/// connect -> send -> receive -> close. One connection, one write, one read.
std::string exchange(const Endpoint& endpoint, const std::string& payload);

} // namespace coord::net
