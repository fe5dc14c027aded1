/**
 * PeerClient — Connects to the host and exchanges frames with it.
 *
 * Opens a TCP connection, sends the username, waits for the host's
 * decision and then runs a receive thread that owns the stream buffer
 * and the file-transfer state.
 */

#include "network/peer_client.h"

#include "network/handshake.h"
#include "protocol/frame_codec.h"
#include "protocol/stream_demux.h"
#include "transfer/frame_sinks.h"

#include <spdlog/spdlog.h>

#include <vector>

PeerClient::PeerClient(std::filesystem::path downloads_dir, std::size_t chunk_size)
    : chunk_size_(chunk_size),
      receiver_(std::move(downloads_dir)) {}

PeerClient::~PeerClient() {
    disconnect();
}

void PeerClient::set_on_message(TextCallback cb)  { on_message_ = std::move(cb); }
void PeerClient::set_on_log(TextCallback cb)      { on_log_ = std::move(cb); }
void PeerClient::set_on_error(TextCallback cb)    { on_error_ = std::move(cb); }
void PeerClient::set_on_closed(ClosedCallback cb) { on_closed_ = std::move(cb); }

void PeerClient::connect(const std::string& ip, uint16_t port, const std::string& username) {
    spdlog::info("Connecting to host {}:{} as {}", ip, port, username.empty() ? "<anonymous>" : username);
    auto conn = TcpConnection::open(io_, ip, port);
    if (send_timeout_.count() > 0) conn->set_send_timeout(send_timeout_);
    connect(std::move(conn), username);
}

void PeerClient::connect(std::shared_ptr<Connection> conn, const std::string& username) {
    Handshake::request(*conn, username);
    spdlog::info("Connection accepted by host");
    conn_ = std::move(conn);
    connected_ = true;
    receive_thread_ = std::thread([this] { receive_loop(); });
}

bool PeerClient::send(const std::string& line) {
    if (!connected_) {
        return false;
    }
    std::string bytes = FrameCodec::encode(TextFrame{line});
    std::lock_guard<std::mutex> lock(unit_mutex_);
    return conn_->send(bytes);
}

TransferProgress PeerClient::send_path(const std::filesystem::path& path,
                                       TransferEngine::ProgressCallback on_progress,
                                       TransferEngine::ErrorCallback on_error) {
    if (!connected_) {
        throw TransferError("Not connected to a host");
    }
    ConnectionSink sink(*conn_, unit_mutex_);
    TransferEngine engine(sink, chunk_size_);
    engine.set_on_progress(std::move(on_progress));
    engine.set_on_error(std::move(on_error));
    return engine.send_path(path);
}

void PeerClient::disconnect() {
    if (conn_) {
        conn_->close();
    }
    if (receive_thread_.joinable() && receive_thread_.get_id() != std::this_thread::get_id()) {
        receive_thread_.join();
    }
}

void PeerClient::receive_loop() {
    StreamDemux demux(StreamDemux::Mode::Receive);
    std::vector<char> buf(chunk_size_);
    bool announced = false;

    while (true) {
        std::size_t n = conn_->receive(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        demux.feed(buf.data(), n);

        while (true) {
            std::optional<Frame> frame;
            try {
                frame = demux.next();
            } catch (const FrameError& e) {
                error(std::string("Received corrupted message: ") + e.what());
                continue;
            }
            if (!frame) {
                break;
            }
            announced = false;
            handle(std::move(*frame));
        }

        const auto& state = demux.transfer_state();
        if (state && !announced) {
            log("Receiving file '" + state->header.relative_path + "' from " +
                state->header.sender.value_or("host") + " (" +
                std::to_string(state->header.size) + " bytes)");
            announced = true;
        }
    }

    if (demux.transfer_state()) {
        error("Connection to host lost during file transfer");
    } else {
        log("Connection to host lost");
    }
    connected_ = false;
    conn_->close();
    if (on_closed_) on_closed_();
}

void PeerClient::handle(Frame frame) {
    try {
        if (auto* text = std::get_if<TextFrame>(&frame)) {
            if (on_message_) on_message_(text->line);
        } else if (auto* folder = std::get_if<FolderHeaderFrame>(&frame)) {
            receiver_.begin_folder(*folder);
            log("Receiving folder '" + folder->name + "' from " + folder->sender.value_or("host"));
        } else if (auto* end = std::get_if<FolderEndFrame>(&frame)) {
            receiver_.end_folder(*end);
            log("Successfully downloaded folder '" + end->name + "' from " + end->sender.value_or("host"));
        } else if (auto* file = std::get_if<FileFrame>(&frame)) {
            auto saved = receiver_.write_file(*file);
            log("Successfully downloaded '" + saved.filename().string() + "'");
        }
    } catch (const TransferError& e) {
        error(e.what());
    }
}

void PeerClient::log(const std::string& text) {
    spdlog::info("{}", text);
    if (on_log_) on_log_(text);
}

void PeerClient::error(const std::string& text) {
    spdlog::warn("{}", text);
    if (on_error_) on_error_(text);
}
