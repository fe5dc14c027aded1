#pragma once

#include "protocol/frame.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/**
 * Reassembles frames from the raw byte stream of one connection.
 *
 * Bytes arrive in arbitrary fragments; `next()` yields a frame only once
 * it is complete. A file header and its payload are one unit: the frame
 * is emitted when every payload byte has been buffered, and payload bytes
 * are never inspected for delimiters or tags.
 *
 * Owned by the receive thread of its connection; not thread-safe.
 */
class StreamDemux {
public:
    enum class Mode {
        /// Host: the header line stays buffered until the payload is complete.
        Relay,
        /// Client: the header line is consumed and the demux tracks the
        /// outstanding payload in its transfer state.
        Receive,
    };

    /// Payload still expected for the file currently being received.
    struct ReceivingFile {
        FileHeader header;
        uint64_t remaining = 0;
    };

    explicit StreamDemux(Mode mode);

    void feed(const char* data, std::size_t len);
    void feed(const std::string& bytes) { feed(bytes.data(), bytes.size()); }

    /// Extract the next complete frame, or nothing if more bytes are needed.
    /// A malformed line is consumed first, then FrameError is thrown;
    /// calling `next()` again continues after it.
    std::optional<Frame> next();

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] std::size_t buffered() const { return buffer_.size() - head_; }

    /// Set while a Receive-mode demux waits for payload bytes.
    [[nodiscard]] const std::optional<ReceivingFile>& transfer_state() const { return receiving_; }

    /// True when no partial frame is held.
    [[nodiscard]] bool idle() const { return !receiving_ && buffered() == 0; }

private:
    std::optional<Frame> take_payload();
    void consume(std::size_t n);

    Mode mode_;
    std::string buffer_;
    std::size_t head_ = 0;
    std::optional<ReceivingFile> receiving_;
};
