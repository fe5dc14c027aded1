#include "ui/console_frontend.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(ConsoleFrontend, CleansPathArguments) {
    EXPECT_EQ(clean_path_argument("  /tmp/a b.txt  "), "/tmp/a b.txt");
    EXPECT_EQ(clean_path_argument("\"/tmp/with space\""), "/tmp/with space");
    EXPECT_EQ(clean_path_argument("'photos'"), "photos");
    EXPECT_EQ(clean_path_argument("\"unbalanced'"), "\"unbalanced'");
}

TEST(ConsoleFrontend, ReportsCommandsWithoutConnection) {
    TempDir tmp;
    NodeConfig config;
    config.downloads_dir = (tmp.path() / "downloads").string();
    EventQueue events;
    Node node(config, events);
    std::istringstream in("hello\n\nsend \"" + (tmp.path() / "x").string() + "\"\nexit\nignored\n");
    std::ostringstream out;
    {
        ConsoleFrontend frontend(node, events, in, out);
        frontend.run();
    }
    std::string printed = out.str();
    EXPECT_NE(printed.find("[!] Not connected"), std::string::npos);
    EXPECT_EQ(printed.find("ignored"), std::string::npos);
}

TEST(ConsoleFrontend, HostBroadcastIsEchoed) {
    NodeConfig config;
    config.role = NodeConfig::Role::Host;
    config.port = 0;
    EventQueue events;
    Node node(config, events);
    ASSERT_TRUE(node.start());
    std::istringstream in("good morning\n");
    std::ostringstream out;
    {
        ConsoleFrontend frontend(node, events, in, out);
        frontend.run();
    }
    std::string printed = out.str();
    EXPECT_NE(printed.find("[HOST] says: good morning\n"), std::string::npos);
    EXPECT_NE(printed.find("--- Connections closed. ---"), std::string::npos);
}
