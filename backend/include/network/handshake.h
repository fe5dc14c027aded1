#pragma once

#include "network/connection.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/// Denial, unexpected reply, or a connection lost before the reply.
class HandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Decides whether `username` at `address` may join.
using ConsentHandler = std::function<bool(const std::string& address,
                                          const std::string& username)>;

/**
 * Exchange that precedes the framed protocol on every connection.
 *
 *   client -> host : raw identity bytes (a username, or CONNECT_REQUEST)
 *   host -> client : CONNECT_ACCEPT | CONNECT_DENY
 */
class Handshake {
public:
    static constexpr std::string_view kConnectRequest = "CONNECT_REQUEST";
    static constexpr std::string_view kAccept = "CONNECT_ACCEPT";
    static constexpr std::string_view kDeny = "CONNECT_DENY";

    /// Largest identity the host reads in its single identity read.
    static constexpr std::size_t kMaxIdentitySize = 1024;

    /// Usernames travel inside frames, so they may not contain the frame
    /// delimiter or the field separator.
    static bool is_valid_username(std::string_view username);

    /// Client side: send `identity` (CONNECT_REQUEST when empty) and wait
    /// for the host's decision. Throws HandshakeError unless accepted.
    static void request(Connection& conn, const std::string& identity);

    /// Host side: read the identity, ask for consent and reply. Returns the
    /// username of the admitted peer; on denial or a malformed identity the
    /// denial token is sent, the connection is closed and nothing is returned.
    static std::optional<std::string> admit(Connection& conn, const ConsentHandler& consent);
};
