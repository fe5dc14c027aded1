#include "network/peer_registry.h"

#include <algorithm>

bool PeerRegistry::add(PeerPtr peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerPtr& p) {
        return p->connection == peer->connection;
    });
    if (it != peers_.end()) {
        return false;
    }
    peers_.push_back(std::move(peer));
    return true;
}

bool PeerRegistry::remove(const Connection* connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerPtr& p) {
        return p->connection.get() == connection;
    });
    if (it == peers_.end()) {
        return false;
    }
    peers_.erase(it);
    return true;
}

std::vector<PeerPtr> PeerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_;
}

PeerPtr PeerRegistry::find(const Connection* connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : peers_) {
        if (p->connection.get() == connection) return p;
    }
    return nullptr;
}

std::size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerRegistry::close_all() {
    std::vector<PeerPtr> peers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peers.swap(peers_);
    }
    for (const auto& p : peers) {
        p->connection->close();
    }
}
