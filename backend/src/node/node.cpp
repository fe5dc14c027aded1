/**
 * Node — Represents the local P2P node.
 *
 * Owns either the host (PeerServer) or the client (PeerClient), turns
 * front-end commands into protocol traffic and reports every outcome on
 * the event queue. Commands may be issued from any thread.
 */

#include "node/node.h"

#include "network/handshake.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "protocol/frame_codec.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <sstream>
#include <utility>
#include <variant>
#include <vector>

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// A chat line must not read as a control frame on the other side.
bool is_plain_text(const std::string& line) {
    try {
        return std::holds_alternative<TextFrame>(FrameCodec::decode_header_line(line));
    } catch (const FrameError&) {
        return false;
    }
}

} // namespace

Node::Node(NodeConfig config, EventQueue& events)
    : config_(std::move(config)),
      events_(events),
      username_(config_.username) {}

Node::~Node() {
    stop();
}

bool Node::is_host() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_ != nullptr;
}

bool Node::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ && client_->connected();
}

uint16_t Node::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_ ? server_->port() : 0;
}

void Node::post(Event event) {
    if (!events_.push(std::move(event))) {
        spdlog::debug("Event queue closed, dropping event");
    }
}

bool Node::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (server_ || (client_ && client_->connected())) {
        post(Event::error("Node is already running"));
        return false;
    }

    auto server = std::make_shared<PeerServer>(config_.port, config_.chunk_size);
    server->set_send_timeout(std::chrono::milliseconds(config_.send_timeout_ms));
    server->set_on_consent([this](const std::string& address, const std::string& username) {
        return ask_consent(address, username);
    });
    server->set_on_join([this](const Peer& peer) {
        post(Event::log("Accepted connection from " + peer.username + "."));
    });
    server->set_on_leave([this](const Peer& peer) {
        post(Event::log(peer.username + " has left the chat"));
    });
    server->set_on_decode_error([this](const Peer& peer, const std::string& error) {
        post(Event::error("Received corrupted message from " + peer.username + ": " + error));
    });
    server->set_on_message([this](const Peer& from, const Frame& relayed) {
        if (auto* text = std::get_if<TextFrame>(&relayed)) {
            post(Event::chat(text->line));
        } else if (auto* file = std::get_if<FileFrame>(&relayed)) {
            post(Event::log("Relayed file '" + file->header.relative_path + "' from " + from.username + "."));
        } else if (auto* folder = std::get_if<FolderHeaderFrame>(&relayed)) {
            post(Event::log("Relaying folder '" + folder->name + "' from " + from.username + "."));
        } else if (auto* end = std::get_if<FolderEndFrame>(&relayed)) {
            post(Event::log("Finished relaying folder '" + end->name + "' from " + from.username + "."));
        }
    });

    try {
        server->start();
    } catch (const asio::system_error& e) {
        spdlog::error("Could not start host on port {}: {}", config_.port, e.what());
        post(Event::error("Could not start host: " + std::string(e.what())));
        return false;
    }

    asio::io_context io;
    std::string address = local_address(io);
    server_ = std::move(server);
    client_.reset();
    post(Event::log("Host is listening on " + address + ":" + std::to_string(server_->port()) + "..."));
    post(Event::host_started(address));
    return true;
}

bool Node::connect(const std::string& address, const std::string& username) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (server_ || (client_ && client_->connected())) {
            post(Event::error("Node is already running"));
            return false;
        }
    }
    if (!username.empty() && !Handshake::is_valid_username(username)) {
        post(Event::error("Invalid username: it may not contain '::' or line breaks"));
        return false;
    }

    auto client = std::make_shared<PeerClient>(config_.downloads_dir, config_.chunk_size);
    client->set_send_timeout(std::chrono::milliseconds(config_.send_timeout_ms));
    client->set_on_message([this](const std::string& text) { post(Event::chat(text)); });
    client->set_on_log([this](const std::string& text) { post(Event::log(text)); });
    client->set_on_error([this](const std::string& text) { post(Event::error(text)); });
    client->set_on_closed([this] { post(Event::disconnected("Connection to host closed.")); });

    try {
        client->connect(address, config_.port, username);
    } catch (const HandshakeError& e) {
        post(Event::error(e.what()));
        return false;
    } catch (const asio::system_error& e) {
        spdlog::error("Connection to {}:{} failed: {}", address, config_.port, e.what());
        post(Event::error("Connection failed: " + std::string(e.what())));
        return false;
    }

    std::shared_ptr<PeerClient> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        username_ = username;
        previous = std::exchange(client_, std::move(client));
    }
    if (previous) previous->disconnect();
    post(Event::connected(address));
    return true;
}

void Node::send_text(const std::string& text) {
    std::shared_ptr<PeerServer> server;
    std::shared_ptr<PeerClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = server_;
        client = client_;
    }

    for (const auto& line : split_lines(text)) {
        if (!is_plain_text(line)) {
            post(Event::error("Message not sent: it looks like a protocol header"));
            continue;
        }
        if (server) {
            post(Event::chat(server->send_text(line)));
        } else if (client && client->connected()) {
            if (client->send(line)) {
                post(Event::chat("[You]: " + line));
            } else {
                post(Event::error("Could not send message: connection lost"));
            }
        } else {
            post(Event::error("Not connected"));
            return;
        }
    }
}

void Node::send_path(const std::string& path) {
    std::shared_ptr<PeerServer> server;
    std::shared_ptr<PeerClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = server_;
        client = client_;
    }
    if (!server && !(client && client->connected())) {
        post(Event::error("Not connected"));
        return;
    }

    int last_percent = -1;
    auto on_progress = [this, &last_percent](const TransferProgress& p) { post_progress(p, last_percent); };
    auto on_error = [this](const std::string& message) { post(Event::error(message)); };
    const std::string name = display_name(path);

    try {
        post(Event::log("Sending '" + name + "'..."));
        TransferProgress done = server ? server->send_path(path, on_progress, on_error)
                                       : client->send_path(path, on_progress, on_error);
        post(Event::log("Finished sending '" + name + "' (" + std::to_string(done.files_sent) + "/" +
                        std::to_string(done.total_files) + " files)."));
    } catch (const TransferError& e) {
        post(Event::error(e.what()));
    }
}

void Node::post_progress(const TransferProgress& progress, int& last_percent) {
    int percent = progress.total_bytes == 0
                      ? 100
                      : static_cast<int>(progress.bytes_sent * 100 / progress.total_bytes);
    bool file_done = progress.files_sent == progress.total_files;
    if (percent == last_percent && !file_done) {
        return;
    }
    last_percent = percent;
    post(Event::transfer_progress(progress));
}

bool Node::ask_consent(const std::string& address, const std::string& username) {
    if (config_.auto_accept) {
        return true;
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto decided = std::make_shared<std::atomic<bool>>(false);
    auto future = promise->get_future();
    bool queued = events_.push(Event::connection_request(address, username,
        [promise, decided](bool accept) {
            if (!decided->exchange(true)) promise->set_value(accept);
        }));
    if (!queued) {
        return false;
    }

    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (stopping_) return false;
    }
    return future.get();
}

void Node::stop() {
    std::shared_ptr<PeerServer> server;
    std::shared_ptr<PeerClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server.swap(server_);
        client.swap(client_);
    }
    if (!server && !client) {
        return;
    }

    stopping_ = true;
    if (server) server->stop();
    if (client) client->disconnect();
    stopping_ = false;
    post(Event::log("Connections closed."));
}
