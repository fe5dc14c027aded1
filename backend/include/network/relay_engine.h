#pragma once

#include "network/peer_registry.h"
#include "protocol/frame.h"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/**
 * Host-side fan-out: forwards frames from one peer to all the others.
 *
 * All broadcasts share one fan-out lock, so the bytes of one frame are
 * never interleaved with another frame on any connection. A peer whose
 * send fails is removed after the fan-out and its departure announced;
 * the remaining peers still receive the frame.
 */
class RelayEngine {
public:
    /// Sender name used for frames the host originates itself.
    static constexpr const char* kHostName = "HOST";

    using DepartureCallback = std::function<void(const Peer& peer)>;

    explicit RelayEngine(PeerRegistry& registry);

    /// Invoked once per peer that leaves, after it was removed.
    void set_on_departure(DepartureCallback cb);

    /// Rewrite a frame received from `sender` and forward it to every
    /// other peer. Returns the frame as forwarded.
    Frame relay(const Peer& sender, Frame frame);

    /// Rewrite a frame originated by the host and send it to every peer.
    Frame relay_from_host(Frame frame);

    /// Send `frame` unchanged to every peer except `exclude`.
    /// Returns the number of peers it was delivered to.
    std::size_t broadcast(const Frame& frame, const Connection* exclude = nullptr);

    /// Tell everyone but the newcomer that `peer` joined.
    void announce_join(const Peer& peer);

    /// Remove the peer owning `connection` and tell the others it left.
    /// Returns false if it had already been removed.
    bool remove_peer(const Connection* connection);

    /**
     * A file header followed by its payload, streamed chunk by chunk to
     * every peer while holding the fan-out lock.
     */
    class FileUnit {
    public:
        FileUnit(RelayEngine& engine, const FileHeader& header);
        ~FileUnit();

        FileUnit(const FileUnit&) = delete;
        FileUnit& operator=(const FileUnit&) = delete;

        void write(const char* data, std::size_t len);

        [[nodiscard]] std::size_t recipients() const { return targets_.size(); }

    private:
        void send_to_targets(const char* data, std::size_t len);

        RelayEngine& engine_;
        std::unique_lock<std::mutex> lock_;
        std::vector<PeerPtr> targets_;
        std::vector<PeerPtr> failed_;
    };

    [[nodiscard]] PeerRegistry& registry() { return registry_; }

private:
    std::size_t fan_out(const std::string& bytes, const Connection* exclude);
    void drop_failed(const std::vector<PeerPtr>& failed);

    PeerRegistry& registry_;
    std::mutex fan_out_mutex_;
    DepartureCallback on_departure_;
};

/// "[<user>] says: <text>"
std::string says_line(const std::string& username, const std::string& text);
