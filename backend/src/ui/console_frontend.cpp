/**
 * ConsoleFrontend — terminal UI on top of the Node command surface.
 *
 * A printer thread drains the event queue; the calling thread reads
 * stdin. Neither blocks the core.
 */

#include "ui/console_frontend.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <istream>
#include <ostream>

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

std::string clean_path_argument(const std::string& raw) {
    std::string path = trim(raw);
    if (path.size() >= 2 && (path.front() == '"' || path.front() == '\'') && path.back() == path.front()) {
        path = path.substr(1, path.size() - 2);
    }
    return path;
}

ConsoleFrontend::ConsoleFrontend(Node& node, EventQueue& events, std::istream& in, std::ostream& out)
    : node_(node), events_(events), in_(in), out_(out) {
    printer_ = std::thread([this] { drain_events(); });
}

ConsoleFrontend::~ConsoleFrontend() {
    events_.close();
    if (printer_.joinable()) printer_.join();
}

void ConsoleFrontend::run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (answer_pending(line)) continue;
        line = trim(line);
        if (line.empty()) continue;
        if (lower(line) == "exit") break;
        handle_line(line);
    }
    node_.stop();
}

void ConsoleFrontend::handle_line(const std::string& line) {
    if (lower(line.substr(0, 5)) == "send ") {
        node_.send_path(clean_path_argument(line.substr(5)));
    } else {
        node_.send_text(line);
    }
}

bool ConsoleFrontend::answer_pending(const std::string& line) {
    Event::Decision decide;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!pending_) return false;
        decide = std::move(pending_);
        pending_ = nullptr;
    }
    decide(lower(trim(line)) == "y");
    return true;
}

void ConsoleFrontend::drain_events() {
    Event event;
    while (events_.pop(event)) {
        spdlog::debug("Event {}: {}", to_string(event.type), event.text);
        if (event.type == Event::Type::ConnectionRequest) {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            // An unanswered earlier request is refused.
            if (pending_) pending_(false);
            pending_ = event.decide;
        }
        print(event);
    }
}

void ConsoleFrontend::print(const Event& event) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    switch (event.type) {
        case Event::Type::Chat:
            out_ << event.text << "\n";
            break;
        case Event::Type::Log:
        case Event::Type::HostStarted:
        case Event::Type::Connected:
        case Event::Type::Disconnected:
            out_ << "--- " << event.text << " ---\n";
            break;
        case Event::Type::Error:
            out_ << "[!] " << event.text << "\n";
            break;
        case Event::Type::ConnectionRequest:
            out_ << event.text << " (y/n): " << std::flush;
            break;
        case Event::Type::Progress: {
            const auto& p = event.progress;
            double percent = p.total_bytes ? 100.0 * static_cast<double>(p.bytes_sent) /
                                                 static_cast<double>(p.total_bytes)
                                           : 100.0;
            out_ << "Progress: " << std::fixed << std::setprecision(1) << percent << "% "
                 << p.files_sent << "/" << p.total_files << " files\n";
            break;
        }
    }
    out_.flush();
}
