#pragma once

#include "network/connection.h"
#include "network/handshake.h"
#include "network/peer_registry.h"
#include "network/relay_engine.h"
#include "protocol/frame.h"
#include "transfer/transfer_engine.h"
#include "util/blocking_queue.h"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Host role: accepts peers, admits them through the handshake and relays
 * every frame a peer sends to all the others.
 *
 * Threads: one runs the accept loop, one admits pending connections one
 * at a time, and each admitted peer gets its own receive thread.
 */
class PeerServer {
public:
    using MessageCallback = std::function<void(const Peer& from, const Frame& relayed)>;
    using PeerCallback    = std::function<void(const Peer& peer)>;
    using ErrorCallback   = std::function<void(const Peer& peer, const std::string& error)>;

    PeerServer(uint16_t port, std::size_t chunk_size);
    ~PeerServer();

    PeerServer(const PeerServer&) = delete;
    PeerServer& operator=(const PeerServer&) = delete;

    /// Bind and start accepting. Throws asio::system_error if the port
    /// cannot be bound.
    void start();

    /// Close the listener and every peer connection, then join all threads.
    void stop();

    /// Set the callback invoked when a complete frame was relayed.
    void set_on_message(MessageCallback cb);
    void set_on_consent(ConsentHandler cb);
    void set_on_join(PeerCallback cb);
    void set_on_leave(PeerCallback cb);
    void set_on_decode_error(ErrorCallback cb);

    /// Applied to every accepted connection. Zero waits forever.
    void set_send_timeout(std::chrono::milliseconds timeout) { send_timeout_ = timeout; }

    /// Broadcast the host's own chat line. Returns the line as sent.
    std::string send_text(const std::string& text);

    /// Send a file or folder from the host to every peer.
    TransferProgress send_path(const std::filesystem::path& path,
                               TransferEngine::ProgressCallback on_progress,
                               TransferEngine::ErrorCallback on_error);

    /// Port actually bound (useful when constructed with port 0).
    [[nodiscard]] uint16_t port() const { return bound_port_; }
    [[nodiscard]] bool running() const { return running_; }
    [[nodiscard]] PeerRegistry& registry() { return registry_; }
    [[nodiscard]] RelayEngine& relay() { return relay_; }
    /// Receive threads not yet joined, finished or not.
    [[nodiscard]] std::size_t peer_thread_count() const;

private:
    void do_accept();
    void admit_loop();
    void admit(const std::shared_ptr<TcpConnection>& conn);
    void receive_loop(PeerPtr peer);
    void reap_finished_threads();

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    std::size_t chunk_size_;
    std::chrono::milliseconds send_timeout_{0};
    std::atomic<bool> running_{false};

    PeerRegistry registry_;
    RelayEngine relay_;
    BlockingQueue<std::shared_ptr<TcpConnection>> pending_;

    std::mutex admitting_mutex_;
    std::shared_ptr<TcpConnection> admitting_;

    std::thread accept_thread_;
    std::thread admit_thread_;
    mutable std::mutex threads_mutex_;
    std::map<std::thread::id, std::thread> peer_threads_;
    std::vector<std::thread::id> finished_threads_;

    MessageCallback on_message_;
    ConsentHandler on_consent_;
    PeerCallback on_join_;
    PeerCallback on_leave_;
    ErrorCallback on_decode_error_;
};

/// Best guess at the address other machines on the LAN can reach.
std::string local_address(asio::io_context& io);
