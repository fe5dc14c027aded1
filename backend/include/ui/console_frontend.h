#pragma once

#include "node/events.h"
#include "node/node.h"

#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>

/**
 * Minimal terminal front end: prints events and turns input lines into
 * node commands.
 *
 *   exit          stop and quit
 *   send <path>   send a file or folder
 *   anything else a chat message
 *
 * While a connection request is pending the next line answers it.
 */
class ConsoleFrontend {
public:
    ConsoleFrontend(Node& node, EventQueue& events, std::istream& in, std::ostream& out);
    ~ConsoleFrontend();

    /// Read input until `exit` or end of input.
    void run();

private:
    void drain_events();
    void print(const Event& event);
    bool answer_pending(const std::string& line);
    void handle_line(const std::string& line);

    Node& node_;
    EventQueue& events_;
    std::istream& in_;
    std::ostream& out_;

    std::mutex out_mutex_;
    std::mutex pending_mutex_;
    Event::Decision pending_;
    std::thread printer_;
};

/// Strip surrounding whitespace and one pair of matching quotes.
std::string clean_path_argument(const std::string& raw);
