/**
 * TcpConnection — blocking reads and writes on an asio TCP socket.
 *
 * Each accepted or connected socket is driven by its own thread; no
 * io_context needs to run for synchronous operations. Writes go through
 * ::send so that SO_SNDTIMEO can end a write to a peer that stopped
 * reading; asio's own blocking write would keep waiting.
 */

#include "network/connection.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>

namespace {

std::string endpoint_address(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

} // namespace

TcpConnection::TcpConnection(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)),
      remote_address_(endpoint_address(socket_)) {
    asio::error_code ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

TcpConnection::~TcpConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

std::shared_ptr<TcpConnection> TcpConnection::open(asio::io_context& io,
                                                   const std::string& host,
                                                   uint16_t port) {
    asio::ip::tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(host, std::to_string(port));
    asio::ip::tcp::socket socket(io);
    asio::connect(socket, endpoints);
    return std::make_shared<TcpConnection>(std::move(socket));
}

void TcpConnection::set_send_timeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(socket_.native_handle(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        spdlog::warn("Could not set send timeout for {}: {}", remote_address_, std::strerror(errno));
    }
}

bool TcpConnection::send(const char* data, std::size_t len) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* p = data;
    std::size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::send(socket_.native_handle(), p, remaining, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                spdlog::warn("Write to {} timed out, dropping the connection", remote_address_);
                close();
            } else {
                spdlog::debug("Write to {} failed: {}", remote_address_, std::strerror(errno));
            }
            return false;
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

std::size_t TcpConnection::receive(char* buffer, std::size_t capacity) {
    asio::error_code ec;
    std::size_t n = socket_.read_some(asio::buffer(buffer, capacity), ec);
    if (ec) {
        if (ec != asio::error::eof) {
            spdlog::debug("Read from {} ended: {}", remote_address_, ec.message());
        }
        return 0;
    }
    return n;
}

void TcpConnection::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    // Shutdown wakes a reader blocked in read_some; the descriptor itself
    // is released by the destructor once no thread can still use it.
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        spdlog::debug("Shutdown of {} failed: {}", remote_address_, ec.message());
    }
}
