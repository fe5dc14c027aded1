/**
 * PeerServer — Host side of the chat.
 *
 * Uses standalone ASIO. The accept loop runs asynchronously on its own
 * io_context thread so that stop() can cancel it; accepted sockets are
 * then driven synchronously, one thread per peer, and every frame a peer
 * sends is relayed to all the others.
 */

#include "network/peer_server.h"

#include "protocol/frame_codec.h"
#include "protocol/stream_demux.h"
#include "transfer/frame_sinks.h"

#include <spdlog/spdlog.h>

PeerServer::PeerServer(uint16_t port, std::size_t chunk_size)
    : acceptor_(io_),
      port_(port),
      chunk_size_(chunk_size),
      relay_(registry_) {
    relay_.set_on_departure([this](const Peer& peer) {
        if (on_leave_) on_leave_(peer);
    });
}

PeerServer::~PeerServer() {
    stop();
}

void PeerServer::set_on_message(MessageCallback cb)              { on_message_ = std::move(cb); }
void PeerServer::set_on_consent(ConsentHandler cb)    { on_consent_ = std::move(cb); }
void PeerServer::set_on_join(PeerCallback cb)                    { on_join_ = std::move(cb); }
void PeerServer::set_on_leave(PeerCallback cb)                   { on_leave_ = std::move(cb); }
void PeerServer::set_on_decode_error(ErrorCallback cb)           { on_decode_error_ = std::move(cb); }

void PeerServer::start() {
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();
    accept_thread_ = std::thread([this] { io_.run(); });
    admit_thread_ = std::thread([this] { admit_loop(); });
    spdlog::info("Host is listening on port {}", bound_port_);
}

void PeerServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::post(io_, [this] {
        asio::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) accept_thread_.join();

    pending_.close();
    {
        std::lock_guard<std::mutex> lock(admitting_mutex_);
        if (admitting_) admitting_->close();
    }
    if (admit_thread_.joinable()) admit_thread_.join();

    std::shared_ptr<TcpConnection> leftover;
    while (pending_.pop(leftover)) {
        leftover->close();
    }

    registry_.close_all();
    std::map<std::thread::id, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(peer_threads_);
        finished_threads_.clear();
    }
    for (auto& entry : threads) {
        if (entry.second.joinable()) entry.second.join();
    }
    spdlog::info("Host stopped");
}

void PeerServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }
        if (ec) {
            spdlog::error("Error accepting connections: {}", ec.message());
        } else {
            auto conn = std::make_shared<TcpConnection>(std::move(socket));
            if (send_timeout_.count() > 0) conn->set_send_timeout(send_timeout_);
            spdlog::info("New connection request from {}", conn->remote_address());
            if (!pending_.push(conn)) {
                conn->close();
            }
        }
        do_accept();
    });
}

void PeerServer::admit_loop() {
    std::shared_ptr<TcpConnection> conn;
    while (pending_.pop(conn)) {
        if (!running_) {
            conn->close();
            continue;
        }
        admit(conn);
    }
}

void PeerServer::admit(const std::shared_ptr<TcpConnection>& conn) {
    reap_finished_threads();
    {
        std::lock_guard<std::mutex> lock(admitting_mutex_);
        admitting_ = conn;
    }
    ConsentHandler consent = on_consent_;
    if (!consent) {
        consent = [](const std::string&, const std::string&) { return true; };
    }
    auto username = Handshake::admit(*conn, consent);
    {
        std::lock_guard<std::mutex> lock(admitting_mutex_);
        admitting_.reset();
    }
    if (!username) {
        return;
    }
    if (!running_) {
        conn->close();
        return;
    }

    auto peer = std::make_shared<const Peer>(Peer{conn, conn->remote_address(), *username});
    registry_.add(peer);
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        std::thread t(&PeerServer::receive_loop, this, peer);
        auto id = t.get_id();
        peer_threads_.emplace(id, std::move(t));
    }
    relay_.announce_join(*peer);
    if (on_join_) on_join_(*peer);
}

void PeerServer::receive_loop(PeerPtr peer) {
    StreamDemux demux(StreamDemux::Mode::Relay);
    std::vector<char> buf(chunk_size_);

    while (true) {
        std::size_t n = peer->connection->receive(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        demux.feed(buf.data(), n);

        while (true) {
            std::optional<Frame> frame;
            try {
                frame = demux.next();
            } catch (const FrameError& e) {
                spdlog::warn("Received corrupted message from {}: {}", peer->username, e.what());
                if (on_decode_error_) on_decode_error_(*peer, e.what());
                continue;
            }
            if (!frame) {
                break;
            }
            if (std::holds_alternative<FileFrame>(*frame)) {
                spdlog::info("Relaying file '{}' from {}",
                             std::get<FileFrame>(*frame).header.relative_path, peer->username);
            }
            Frame relayed = relay_.relay(*peer, std::move(*frame));
            if (on_message_) on_message_(*peer, relayed);
        }
    }

    if (!demux.idle()) {
        spdlog::warn("{} disconnected with {} byte(s) of an unfinished frame",
                     peer->username, demux.buffered());
    }
    relay_.remove_peer(peer->connection.get());

    std::lock_guard<std::mutex> lock(threads_mutex_);
    finished_threads_.push_back(std::this_thread::get_id());
}

void PeerServer::reap_finished_threads() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (const auto& id : finished_threads_) {
            auto it = peer_threads_.find(id);
            if (it != peer_threads_.end()) {
                done.push_back(std::move(it->second));
                peer_threads_.erase(it);
            }
        }
        finished_threads_.clear();
    }
    // Each of these has returned from receive_loop or is about to.
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

std::size_t PeerServer::peer_thread_count() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return peer_threads_.size();
}

std::string PeerServer::send_text(const std::string& text) {
    Frame sent = relay_.relay_from_host(TextFrame{text});
    return std::get<TextFrame>(sent).line;
}

TransferProgress PeerServer::send_path(const std::filesystem::path& path,
                                       TransferEngine::ProgressCallback on_progress,
                                       TransferEngine::ErrorCallback on_error) {
    if (registry_.empty()) {
        throw TransferError("No clients connected to send files to.");
    }
    BroadcastSink sink(relay_);
    TransferEngine engine(sink, chunk_size_);
    engine.set_on_progress(std::move(on_progress));
    engine.set_on_error(std::move(on_error));
    return engine.send_path(path);
}

std::string local_address(asio::io_context& io) {
    // Connecting a UDP socket sends nothing; it only selects the route.
    try {
        asio::ip::udp::socket socket(io);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (const asio::system_error& e) {
        spdlog::debug("Could not determine local address: {}", e.what());
        return "127.0.0.1";
    }
}
