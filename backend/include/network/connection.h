#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

/**
 * One bidirectional byte stream to a remote participant.
 *
 * A single thread receives; any number of threads may send. Transport
 * failures are reported through return values: a peer going away is a
 * normal event, not an exceptional one.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /// Write all bytes. Returns false if the connection failed.
    virtual bool send(const char* data, std::size_t len) = 0;
    bool send(const std::string& bytes) { return send(bytes.data(), bytes.size()); }

    /// Block until at least one byte arrives. Returns 0 once the stream is
    /// closed, reset or shut down locally.
    virtual std::size_t receive(char* buffer, std::size_t capacity) = 0;

    /// Wake any blocked receive and refuse further traffic. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual std::string remote_address() const = 0;
};

/**
 * Connection over a connected TCP socket, used synchronously.
 */
class TcpConnection : public Connection {
public:
    explicit TcpConnection(asio::ip::tcp::socket socket);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /// Resolve `host` and connect. Throws asio::system_error on failure.
    static std::shared_ptr<TcpConnection> open(asio::io_context& io,
                                               const std::string& host,
                                               uint16_t port);

    /// Bound each blocked write. A write that times out closes the
    /// connection and fails. Zero waits forever.
    void set_send_timeout(std::chrono::milliseconds timeout);

    bool send(const char* data, std::size_t len) override;
    std::size_t receive(char* buffer, std::size_t capacity) override;
    void close() override;

    [[nodiscard]] std::string remote_address() const override { return remote_address_; }

private:
    asio::ip::tcp::socket socket_;
    std::string remote_address_;
    std::mutex write_mutex_;
    std::mutex close_mutex_;
    bool closed_ = false;
};
