#pragma once

#include "network/connection.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * A registered remote participant, as seen by the host.
 */
struct Peer {
    std::shared_ptr<Connection> connection;
    std::string address;
    std::string username;
};

using PeerPtr = std::shared_ptr<const Peer>;

/**
 * Ordered set of connected peers, keyed by connection.
 *
 * Every operation takes the registry lock; callers iterate over a
 * snapshot, never over the live collection.
 */
class PeerRegistry {
public:
    /// Returns false if a peer with the same connection is already present.
    bool add(PeerPtr peer);

    /// Returns true only for the call that actually removed the peer.
    bool remove(const Connection* connection);

    [[nodiscard]] std::vector<PeerPtr> snapshot() const;
    [[nodiscard]] PeerPtr find(const Connection* connection) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// Close every peer connection and forget them all.
    void close_all();

private:
    mutable std::mutex mutex_;
    std::vector<PeerPtr> peers_;
};
