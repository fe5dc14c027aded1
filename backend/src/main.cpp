/**
 * p2p-sharer — Entry Point
 *
 * Loads config, then either starts the host or connects to one, and
 * hands the terminal to the console front end.
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "node/events.h"
#include "node/node.h"
#include "node/node_config.h"
#include "ui/console_frontend.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path = (argc > 1) ? argv[1] : "config.json";
    NodeConfig config;
    try {
        config = NodeConfig::load(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Loaded config from {}", config_path);

    EventQueue events;
    Node node(config, events);
    ConsoleFrontend frontend(node, events, std::cin, std::cout);

    if (config.role == NodeConfig::Role::Host) {
        if (!node.start()) {
            return EXIT_FAILURE;
        }
        std::cout << "--- Host is running. Type messages to broadcast, 'send <path>' to share, "
                     "'exit' to shut down. ---" << std::endl;
    } else {
        std::string username = config.username;
        if (username.empty()) {
            std::cout << "Enter your username: " << std::flush;
            std::getline(std::cin, username);
        }
        if (username.empty()) {
            spdlog::error("Username cannot be empty.");
            return EXIT_FAILURE;
        }
        if (!node.connect(config.host_address, username)) {
            return EXIT_FAILURE;
        }
        std::cout << "--- Connected to Host. Type 'send <path>' to share, 'exit' to disconnect. ---"
                  << std::endl;
    }

    frontend.run();
    return EXIT_SUCCESS;
}
