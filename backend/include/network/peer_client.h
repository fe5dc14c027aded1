#pragma once

#include "network/connection.h"
#include "transfer/file_receiver.h"
#include "transfer/transfer_engine.h"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * Client role: one connection to the host.
 *
 * After the handshake a receive thread demultiplexes frames from the
 * host: chat lines are handed to the message callback, files and folders
 * are written below the downloads directory.
 */
class PeerClient {
public:
    using TextCallback = std::function<void(const std::string& text)>;
    using ClosedCallback = std::function<void()>;

    PeerClient(std::filesystem::path downloads_dir, std::size_t chunk_size);
    ~PeerClient();

    PeerClient(const PeerClient&) = delete;
    PeerClient& operator=(const PeerClient&) = delete;

    /// Connect and perform the handshake with `username` (empty sends
    /// CONNECT_REQUEST). Throws asio::system_error if the host cannot be
    /// reached and HandshakeError if it does not accept.
    void connect(const std::string& ip, uint16_t port, const std::string& username);

    /// Run the client over an already connected stream.
    void connect(std::shared_ptr<Connection> conn, const std::string& username);

    /// Send one chat line. Returns false if the connection failed.
    bool send(const std::string& line);

    /// Send a file or folder to the host. Throws TransferError.
    TransferProgress send_path(const std::filesystem::path& path,
                               TransferEngine::ProgressCallback on_progress,
                               TransferEngine::ErrorCallback on_error);

    void disconnect();

    void set_on_message(TextCallback cb);
    void set_on_log(TextCallback cb);
    void set_on_error(TextCallback cb);

    /// Invoked on the receive thread once the host connection has ended.
    void set_on_closed(ClosedCallback cb);

    /// Applied to the socket opened by connect(ip, port, ...). Zero waits forever.
    void set_send_timeout(std::chrono::milliseconds timeout) { send_timeout_ = timeout; }

    [[nodiscard]] bool connected() const { return connected_; }

private:
    void receive_loop();
    void handle(Frame frame);
    void log(const std::string& text);
    void error(const std::string& text);

    asio::io_context io_;
    std::shared_ptr<Connection> conn_;
    std::mutex unit_mutex_;
    std::size_t chunk_size_;
    std::chrono::milliseconds send_timeout_{0};
    FileReceiver receiver_;
    std::atomic<bool> connected_{false};
    std::thread receive_thread_;

    TextCallback on_message_;
    TextCallback on_log_;
    TextCallback on_error_;
    ClosedCallback on_closed_;
};
