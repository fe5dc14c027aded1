#pragma once

#include "transfer/transfer_engine.h"
#include "util/blocking_queue.h"

#include <functional>
#include <string>

/**
 * Notification from the core to the presentation layer.
 */
struct Event {
    enum class Type {
        Chat,
        Log,
        Error,
        ConnectionRequest,
        HostStarted,
        Connected,
        Progress,
        Disconnected,
    };

    using Decision = std::function<void(bool accept)>;

    Type type = Type::Log;
    std::string text;
    std::string address;
    std::string username;
    TransferProgress progress;
    /// Set on ConnectionRequest; the first call wins.
    Decision decide;

    static Event chat(std::string text);
    static Event log(std::string text);
    static Event error(std::string text);
    static Event connection_request(std::string address, std::string username, Decision decide);
    static Event host_started(std::string address);
    static Event connected(std::string address);
    static Event transfer_progress(const TransferProgress& progress);
    static Event disconnected(std::string reason);
};

/// Core threads push, the presentation layer pops; pushing never blocks.
using EventQueue = BlockingQueue<Event>;

const char* to_string(Event::Type type);
