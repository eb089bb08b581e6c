#include "tcp_client.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

namespace coord::net {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const {
        if (info) ::freeaddrinfo(info);
    }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

std::string describe(const std::string& what, int error_code) {
    return what + ": " + std::strerror(error_code);
}

std::string endpoint_string(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

} // namespace

TcpClient::~TcpClient() {
    close();
}

TcpClient::TcpClient(TcpClient&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

TcpClient& TcpClient::operator=(TcpClient&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void TcpClient::connect(const std::string& host, uint16_t port) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (rc != 0) {
        LOG4CPLUS_ERROR(client_logger(), "Can't resolve " << host << ": " << ::gai_strerror(rc));
        throw ConnectionError("Can't resolve server address " + host + ": " + ::gai_strerror(rc), EHOSTUNREACH);
    }
    AddrInfoPtr addresses(raw);

    int last_error = ECONNREFUSED;
    for (addrinfo* ai = addresses.get(); ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        int result;
        do {
            result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        } while (result < 0 && errno == EINTR);

        if (result == 0) {
            fd_ = fd;
            LOG4CPLUS_INFO(client_logger(), "Connected to server at " << endpoint_string(host, port));
            return;
        }

        last_error = errno;
        ::close(fd);
    }

    LOG4CPLUS_ERROR(client_logger(), "Failed to connect to " << endpoint_string(host, port) << ": "
                                                             << std::strerror(last_error));
    throw ConnectionError(describe("Can't connect to " + endpoint_string(host, port), last_error), last_error);
}

void TcpClient::set_receive_timeout(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        throw ConnectionError("set_receive_timeout on a closed socket", EBADF);
    }

    timeval tv{};
    if (timeout.count() > 0) {
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    }
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        int error_code = errno;
        throw ConnectionError(describe("setsockopt(SO_RCVTIMEO)", error_code), error_code);
    }
}

void TcpClient::send_all(const std::string& data) {
    if (fd_ < 0) {
        throw ConnectionError("send on a closed socket", EBADF);
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int error_code = errno;
            LOG4CPLUS_ERROR(client_logger(), "Failed to send request: " << std::strerror(error_code));
            throw ConnectionError(describe("send", error_code), error_code);
        }
        offset += static_cast<size_t>(written);
    }
}

std::string TcpClient::receive_once(std::size_t max_bytes) {
    if (fd_ < 0) {
        throw ConnectionError("receive on a closed socket", EBADF);
    }

    std::vector<char> buffer(max_bytes);
    ssize_t received;
    do {
        received = ::recv(fd_, buffer.data(), buffer.size(), 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        int error_code = errno;
        if (error_code == EAGAIN || error_code == EWOULDBLOCK) {
            LOG4CPLUS_ERROR(client_logger(), "Timed out waiting for the server response");
            throw TimeoutError("Timed out waiting for the server response", error_code);
        }
        LOG4CPLUS_ERROR(client_logger(), "Failed to receive response: " << std::strerror(error_code));
        throw ConnectionError(describe("recv", error_code), error_code);
    }

    return std::string(buffer.data(), static_cast<size_t>(received));
}

void TcpClient::close() {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

std::string exchange(const Endpoint& endpoint, const std::string& payload) {
    TcpClient client;
    client.connect(endpoint.address, endpoint.port);
    if (endpoint.receive_timeout.count() > 0) {
        client.set_receive_timeout(endpoint.receive_timeout);
    }

    client.send_all(payload);
    LOG4CPLUS_DEBUG(client_logger(), "Sent " << payload.size() << " bytes");

    std::string response = client.receive_once(kReceiveBufferSize);
    LOG4CPLUS_DEBUG(client_logger(), "Received " << response.size() << " bytes");
    return response;
}

} // namespace coord::net
