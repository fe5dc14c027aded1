#include "node/events.h"

#include <utility>

namespace {

Event make(Event::Type type, std::string text) {
    Event e;
    e.type = type;
    e.text = std::move(text);
    return e;
}

} // namespace

Event Event::chat(std::string text)  { return make(Type::Chat, std::move(text)); }
Event Event::log(std::string text)   { return make(Type::Log, std::move(text)); }
Event Event::error(std::string text) { return make(Type::Error, std::move(text)); }

Event Event::connection_request(std::string address, std::string username, Decision decide) {
    Event e = make(Type::ConnectionRequest,
                   "Accept connection from " + username + " (" + address + ")?");
    e.address = std::move(address);
    e.username = std::move(username);
    e.decide = std::move(decide);
    return e;
}

Event Event::host_started(std::string address) {
    Event e = make(Type::HostStarted, "Your IP Address: " + address);
    e.address = std::move(address);
    return e;
}

Event Event::connected(std::string address) {
    Event e = make(Type::Connected, "Connected to host!");
    e.address = std::move(address);
    return e;
}

Event Event::transfer_progress(const TransferProgress& progress) {
    Event e = make(Type::Progress, {});
    e.progress = progress;
    return e;
}

Event Event::disconnected(std::string reason) {
    return make(Type::Disconnected, std::move(reason));
}

const char* to_string(Event::Type type) {
    switch (type) {
        case Event::Type::Chat:              return "chat";
        case Event::Type::Log:               return "log";
        case Event::Type::Error:             return "error";
        case Event::Type::ConnectionRequest: return "connection_request";
        case Event::Type::HostStarted:       return "host_started";
        case Event::Type::Connected:         return "connected";
        case Event::Type::Progress:          return "progress";
        case Event::Type::Disconnected:      return "disconnected";
    }
    return "unknown";
}
