/**
 * Handshake — identity and consent before a connection joins the chat.
 *
 * The client never reads past the reply token, so any frame the host
 * sends right after accepting stays on the socket for the receive loop.
 */

#include "network/handshake.h"

#include "protocol/frame_codec.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace {

bool is_prefix(std::string_view token, const std::string& bytes) {
    return bytes.size() <= token.size() && token.substr(0, bytes.size()) == bytes;
}

void deny_and_close(Connection& conn) {
    if (!conn.send(std::string(Handshake::kDeny))) {
        spdlog::debug("Denial to {} was not delivered", conn.remote_address());
    }
    conn.close();
}

} // namespace

bool Handshake::is_valid_username(std::string_view username) {
    return !username.empty() &&
           FrameCodec::is_valid_utf8(username) &&
           username.find(FrameCodec::kDelimiter) == std::string_view::npos &&
           username.find(FrameCodec::kSeparator) == std::string_view::npos;
}

void Handshake::request(Connection& conn, const std::string& identity) {
    const std::string payload = identity.empty() ? std::string(kConnectRequest) : identity;
    if (!conn.send(payload)) {
        throw HandshakeError("Could not send identity to host");
    }

    std::string reply;
    char buf[64];
    while (reply.size() < kAccept.size()) {
        std::size_t n = conn.receive(buf, kAccept.size() - reply.size());
        if (n == 0) {
            conn.close();
            throw HandshakeError("Connection closed during handshake");
        }
        reply.append(buf, n);
        if (reply == kDeny || (!is_prefix(kAccept, reply) && !is_prefix(kDeny, reply))) {
            break;
        }
    }

    if (reply == kAccept) {
        return;
    }
    conn.close();
    if (reply == kDeny) {
        throw HandshakeError("Connection denied by host");
    }
    throw HandshakeError("Unexpected handshake reply from host");
}

std::optional<std::string> Handshake::admit(Connection& conn, const ConsentHandler& consent) {
    const std::string address = conn.remote_address();
    std::vector<char> buf(kMaxIdentitySize);
    std::size_t n = conn.receive(buf.data(), buf.size());
    if (n == 0) {
        spdlog::info("Client from {} disconnected before sending a name", address);
        conn.close();
        return std::nullopt;
    }

    std::string username(buf.data(), n);
    if (username == kConnectRequest) {
        username = address;
    } else if (!is_valid_username(username)) {
        spdlog::warn("Invalid identity from {}, denying", address);
        deny_and_close(conn);
        return std::nullopt;
    }

    if (!consent(address, username)) {
        spdlog::info("Connection from {} ({}) denied", username, address);
        deny_and_close(conn);
        return std::nullopt;
    }

    if (!conn.send(std::string(kAccept))) {
        spdlog::warn("{} ({}) went away before being admitted", username, address);
        conn.close();
        return std::nullopt;
    }
    spdlog::info("Connection from {} ({}) accepted", username, address);
    return username;
}

