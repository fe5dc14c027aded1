#pragma once

#include "network/connection.h"
#include "network/relay_engine.h"
#include "transfer/transfer_engine.h"

#include <memory>
#include <mutex>

/**
 * Client side: frames go to the host over one connection. `unit_mutex`
 * is shared with every other writer of that connection so a file unit
 * is written without interleaving. Throws TransferError when the
 * connection fails.
 */
class ConnectionSink : public FrameSink {
public:
    ConnectionSink(Connection& conn, std::mutex& unit_mutex);

    void send_control(const Frame& frame) override;
    void begin_file(const FileHeader& header) override;
    void write_payload(const char* data, std::size_t len) override;
    void end_file() override;

private:
    void write(const char* data, std::size_t len);

    Connection& conn_;
    std::mutex& unit_mutex_;
    std::unique_lock<std::mutex> unit_lock_;
};

/**
 * Host side: frames go to every registered peer with the host as sender.
 */
class BroadcastSink : public FrameSink {
public:
    explicit BroadcastSink(RelayEngine& relay);

    void send_control(const Frame& frame) override;
    void begin_file(const FileHeader& header) override;
    void write_payload(const char* data, std::size_t len) override;
    void end_file() override;

private:
    RelayEngine& relay_;
    std::unique_ptr<RelayEngine::FileUnit> unit_;
};
