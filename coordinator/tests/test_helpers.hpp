#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Port on 127.0.0.1 that nothing listens on.
uint16_t unused_port();

/**
 * Coordinator stand-in on 127.0.0.1:<ephemeral>.
 *
 * Connections are served one at a time. The request is read until it parses
 * as JSON, the client goes quiet or closes, and is recorded before anything
 * is written back.
 *   Echo   - send the request back unchanged
 *   Reply  - send each reply chunk in turn, `gap` apart, then close
 *   Silent - never answer, hold the connection until the client leaves
 */
class LoopbackPeer {
public:
    enum class Mode { Echo, Reply, Silent };

    explicit LoopbackPeer(Mode mode,
                          std::vector<std::string> replies = {},
                          std::chrono::milliseconds gap = std::chrono::milliseconds(200));
    ~LoopbackPeer();

    LoopbackPeer(const LoopbackPeer&) = delete;
    LoopbackPeer& operator=(const LoopbackPeer&) = delete;

    uint16_t port() const { return port_; }
    int connections() const { return connections_.load(); }
    std::vector<std::string> requests() const;

private:
    void serve();
    void handle_connection(int fd);
    std::string read_request(int fd);

    Mode mode_;
    std::vector<std::string> replies_;
    std::chrono::milliseconds gap_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<int> connections_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::thread thread_;
};

// Directory under the system temp dir, removed with its contents.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path write(const std::string& name, const std::string& content) const;

private:
    std::filesystem::path path_;
};

std::string read_file(const std::filesystem::path& path);

void init_test_logging();
