/**
 * RelayEngine — rewrites inbound frames with their sender and fans them
 * out to the other registered peers.
 *
 * Text becomes "[user] says: text"; file and folder frames gain the
 * sender field unless they already carry one. Payload bytes are
 * forwarded verbatim.
 */

#include "network/relay_engine.h"

#include "protocol/frame_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace {

Frame tag_sender(Frame frame, const std::string& username) {
    std::visit([&](auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, TextFrame>) {
            f.line = says_line(username, f.line);
        } else if constexpr (std::is_same_v<T, FileFrame>) {
            if (!f.header.sender) f.header.sender = username;
        } else {
            if (!f.sender) f.sender = username;
        }
    }, frame);
    return frame;
}

} // namespace

std::string says_line(const std::string& username, const std::string& text) {
    return "[" + username + "] says: " + text;
}

RelayEngine::RelayEngine(PeerRegistry& registry) : registry_(registry) {}

void RelayEngine::set_on_departure(DepartureCallback cb) {
    on_departure_ = std::move(cb);
}

Frame RelayEngine::relay(const Peer& sender, Frame frame) {
    Frame out = tag_sender(std::move(frame), sender.username);
    std::size_t delivered = broadcast(out, sender.connection.get());
    spdlog::debug("Relayed {} from {} to {} peer(s)", describe(out), sender.username, delivered);
    return out;
}

Frame RelayEngine::relay_from_host(Frame frame) {
    Frame out = tag_sender(std::move(frame), kHostName);
    broadcast(out, nullptr);
    return out;
}

std::size_t RelayEngine::broadcast(const Frame& frame, const Connection* exclude) {
    return fan_out(FrameCodec::encode(frame), exclude);
}

void RelayEngine::announce_join(const Peer& peer) {
    broadcast(TextFrame{"--- " + peer.username + " has joined the chat ---"},
              peer.connection.get());
}

bool RelayEngine::remove_peer(const Connection* connection) {
    PeerPtr peer = registry_.find(connection);
    if (!peer || !registry_.remove(connection)) {
        return false;
    }
    peer->connection->close();
    spdlog::info("{} ({}) has disconnected", peer->username, peer->address);
    if (on_departure_) {
        on_departure_(*peer);
    }
    broadcast(TextFrame{"--- " + peer->username + " has left the chat ---"}, connection);
    return true;
}

std::size_t RelayEngine::fan_out(const std::string& bytes, const Connection* exclude) {
    std::vector<PeerPtr> failed;
    std::size_t delivered = 0;
    {
        std::lock_guard<std::mutex> lock(fan_out_mutex_);
        for (const auto& peer : registry_.snapshot()) {
            if (peer->connection.get() == exclude) continue;
            if (peer->connection->send(bytes)) {
                ++delivered;
            } else {
                failed.push_back(peer);
            }
        }
    }
    drop_failed(failed);
    return delivered;
}

void RelayEngine::drop_failed(const std::vector<PeerPtr>& failed) {
    for (const auto& peer : failed) {
        spdlog::warn("Send to {} failed, removing peer", peer->username);
        remove_peer(peer->connection.get());
    }
}

// ── FileUnit ────────────────────────────────────────────────────────────────

RelayEngine::FileUnit::FileUnit(RelayEngine& engine, const FileHeader& header)
    : engine_(engine),
      lock_(engine.fan_out_mutex_),
      targets_(engine.registry_.snapshot()) {
    std::string line = FrameCodec::encode_file_header(header);
    send_to_targets(line.data(), line.size());
}

RelayEngine::FileUnit::~FileUnit() {
    lock_.unlock();
    engine_.drop_failed(failed_);
}

void RelayEngine::FileUnit::write(const char* data, std::size_t len) {
    send_to_targets(data, len);
}

void RelayEngine::FileUnit::send_to_targets(const char* data, std::size_t len) {
    auto it = std::remove_if(targets_.begin(), targets_.end(), [&](const PeerPtr& peer) {
        if (peer->connection->send(data, len)) return false;
        failed_.push_back(peer);
        return true;
    });
    targets_.erase(it, targets_.end());
}
