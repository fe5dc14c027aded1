#pragma once

#include "node/events.h"
#include "node/node_config.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

class PeerServer;
class PeerClient;

/**
 * Represents the local node: either the relaying host or a client of one.
 *
 * This is the command surface for the front end. Every outcome,
 * including failures, is reported through the event queue; commands do
 * not throw.
 */
class Node {
public:
    Node(NodeConfig config, EventQueue& events);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Become the host and start accepting peers.
    bool start();

    /// Connect to a host. Blocks until the host has decided.
    bool connect(const std::string& address, const std::string& username);

    /// Send a chat message (host: to every peer, client: to the host).
    void send_text(const std::string& text);

    /// Send a file or folder. Blocks until the transfer has finished.
    void send_path(const std::string& path);

    /// Close every connection. The node can be started again afterwards.
    void stop();

    [[nodiscard]] bool is_host() const;
    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] const std::string& username() const { return username_; }
    [[nodiscard]] const NodeConfig& config() const { return config_; }

    /// Port the host is listening on, 0 when not hosting.
    [[nodiscard]] uint16_t port() const;

private:
    bool ask_consent(const std::string& address, const std::string& username);
    void post(Event event);
    void post_progress(const TransferProgress& progress, int& last_percent);

    NodeConfig config_;
    EventQueue& events_;
    std::string username_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::shared_ptr<PeerServer> server_;
    std::shared_ptr<PeerClient> client_;
};
