#include "transfer/frame_sinks.h"

#include "protocol/frame_codec.h"

// ── ConnectionSink ──────────────────────────────────────────────────────────

ConnectionSink::ConnectionSink(Connection& conn, std::mutex& unit_mutex)
    : conn_(conn), unit_mutex_(unit_mutex) {}

void ConnectionSink::send_control(const Frame& frame) {
    std::string bytes = FrameCodec::encode(frame);
    std::lock_guard<std::mutex> lock(unit_mutex_);
    write(bytes.data(), bytes.size());
}

void ConnectionSink::begin_file(const FileHeader& header) {
    unit_lock_ = std::unique_lock<std::mutex>(unit_mutex_);
    std::string line = FrameCodec::encode_file_header(header);
    write(line.data(), line.size());
}

void ConnectionSink::write_payload(const char* data, std::size_t len) {
    write(data, len);
}

void ConnectionSink::end_file() {
    if (unit_lock_.owns_lock()) {
        unit_lock_.unlock();
    }
}

void ConnectionSink::write(const char* data, std::size_t len) {
    if (!conn_.send(data, len)) {
        throw TransferError("Connection to host lost during transfer");
    }
}

// ── BroadcastSink ───────────────────────────────────────────────────────────

BroadcastSink::BroadcastSink(RelayEngine& relay) : relay_(relay) {}

void BroadcastSink::send_control(const Frame& frame) {
    relay_.relay_from_host(frame);
}

void BroadcastSink::begin_file(const FileHeader& header) {
    FileHeader tagged = header;
    tagged.sender = RelayEngine::kHostName;
    unit_ = std::make_unique<RelayEngine::FileUnit>(relay_, tagged);
}

void BroadcastSink::write_payload(const char* data, std::size_t len) {
    if (unit_) {
        unit_->write(data, len);
    }
}

void BroadcastSink::end_file() {
    unit_.reset();
}
