#include "network/relay_engine.h"
#include "protocol/frame_codec.h"
#include "protocol/stream_demux.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

class RelayEngineTest : public ::testing::Test {
protected:
    RelayEngineTest() : engine_(registry_) {}

    PeerPtr join(const std::string& name) {
        auto peer = std::make_shared<Peer>(Peer{std::make_shared<FakeConnection>(), "10.0.0.9", name});
        registry_.add(peer);
        return peer;
    }

    static FakeConnection& conn(const PeerPtr& peer) {
        return static_cast<FakeConnection&>(*peer->connection);
    }

    PeerRegistry registry_;
    RelayEngine engine_;
};

std::vector<Frame> decode_stream(const std::string& bytes) {
    StreamDemux demux(StreamDemux::Mode::Relay);
    demux.feed(bytes);
    std::vector<Frame> frames;
    while (auto f = demux.next()) frames.push_back(std::move(*f));
    EXPECT_TRUE(demux.idle());
    return frames;
}

} // namespace

TEST_F(RelayEngineTest, TextGoesToEveryoneButTheSender) {
    auto alice = join("alice");
    auto bob = join("bob");
    auto carol = join("carol");

    Frame out = engine_.relay(*alice, TextFrame{"hello"});

    EXPECT_EQ(std::get<TextFrame>(out).line, "[alice] says: hello");
    EXPECT_EQ(conn(bob).sent(), "[alice] says: hello\n");
    EXPECT_EQ(conn(carol).sent(), "[alice] says: hello\n");
    EXPECT_TRUE(conn(alice).sent().empty());
}

TEST_F(RelayEngineTest, FileFramesGainTheSender) {
    auto alice = join("alice");
    auto bob = join("bob");

    engine_.relay(*alice, FolderHeaderFrame{std::nullopt, "pics"});
    engine_.relay(*alice, FileFrame{FileHeader{std::nullopt, "pics/a.png", 3}, "\n\n\n"});
    engine_.relay(*alice, FolderEndFrame{std::nullopt, "pics"});

    EXPECT_EQ(conn(bob).sent(),
              "FOLDER_HEADER::alice::pics\n"
              "FILE_HEADER::alice::pics/a.png::3\n\n\n\n"
              "FOLDER_END::alice::pics\n");
}

TEST_F(RelayEngineTest, ExistingSenderIsKept) {
    auto alice = join("alice");
    auto bob = join("bob");

    Frame out = engine_.relay(*alice, FileFrame{FileHeader{std::string("zed"), "x", 1}, "y"});

    EXPECT_EQ(*std::get<FileFrame>(out).header.sender, "zed");
    EXPECT_EQ(conn(bob).sent(), "FILE_HEADER::zed::x::1\ny");
}

TEST_F(RelayEngineTest, HostFramesGoToEveryPeer) {
    auto alice = join("alice");
    auto bob = join("bob");

    engine_.relay_from_host(TextFrame{"welcome"});

    EXPECT_EQ(conn(alice).sent(), "[HOST] says: welcome\n");
    EXPECT_EQ(conn(bob).sent(), "[HOST] says: welcome\n");
}

TEST_F(RelayEngineTest, FailedPeerIsRemovedAndOthersStillReceive) {
    auto alice = join("alice");
    auto bob = join("bob");
    auto carol = join("carol");
    conn(bob).fail_sends(true);

    std::vector<std::string> departed;
    engine_.set_on_departure([&](const Peer& p) { departed.push_back(p.username); });

    engine_.relay(*alice, TextFrame{"hi"});

    EXPECT_EQ(conn(carol).sent(), "[alice] says: hi\n--- bob has left the chat ---\n");
    EXPECT_EQ(conn(alice).sent(), "--- bob has left the chat ---\n");
    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_TRUE(conn(bob).closed());
    EXPECT_EQ(departed, std::vector<std::string>{"bob"});
}

TEST_F(RelayEngineTest, RemovingTwiceAnnouncesOnce) {
    auto alice = join("alice");
    auto bob = join("bob");

    EXPECT_TRUE(engine_.remove_peer(alice->connection.get()));
    EXPECT_FALSE(engine_.remove_peer(alice->connection.get()));
    EXPECT_EQ(conn(bob).sent(), "--- alice has left the chat ---\n");
}

TEST_F(RelayEngineTest, JoinIsAnnouncedToOthersOnly) {
    auto alice = join("alice");
    auto bob = join("bob");

    engine_.announce_join(*bob);

    EXPECT_EQ(conn(alice).sent(), "--- bob has joined the chat ---\n");
    EXPECT_TRUE(conn(bob).sent().empty());
}

TEST_F(RelayEngineTest, BroadcastWithNoPeersDeliversNothing) {
    EXPECT_EQ(engine_.broadcast(TextFrame{"anyone?"}), 0u);
}

TEST_F(RelayEngineTest, FileUnitStreamsChunksToAllPeers) {
    auto alice = join("alice");
    auto bob = join("bob");
    {
        RelayEngine::FileUnit unit(engine_, FileHeader{std::string("HOST"), "a.txt", 6});
        EXPECT_EQ(unit.recipients(), 2u);
        unit.write("abc", 3);
        unit.write("def", 3);
    }
    EXPECT_EQ(conn(alice).sent(), "FILE_HEADER::HOST::a.txt::6\nabcdef");
    EXPECT_EQ(conn(bob).sent(), "FILE_HEADER::HOST::a.txt::6\nabcdef");
}

TEST_F(RelayEngineTest, FileUnitDropsFailingPeerAfterwards) {
    auto alice = join("alice");
    auto bob = join("bob");
    {
        RelayEngine::FileUnit unit(engine_, FileHeader{std::string("HOST"), "a.txt", 2});
        conn(bob).fail_sends(true);
        unit.write("hi", 2);
        EXPECT_EQ(unit.recipients(), 1u);
        EXPECT_EQ(registry_.size(), 2u);
    }
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(conn(alice).sent(), "FILE_HEADER::HOST::a.txt::2\nhi--- bob has left the chat ---\n");
}

TEST_F(RelayEngineTest, ConcurrentSendersNeverInterleave) {
    auto alice = join("alice");
    auto bob = join("bob");
    auto carol = join("carol");
    const std::string payload(2000, '\n');
    constexpr int kRounds = 50;

    std::thread files([&] {
        for (int i = 0; i < kRounds; ++i) {
            RelayEngine::FileUnit unit(engine_, FileHeader{std::string("HOST"), "f", payload.size()});
            for (std::size_t off = 0; off < payload.size(); off += 100) {
                unit.write(payload.data() + off, 100);
            }
        }
    });
    std::thread texts_a([&] {
        for (int i = 0; i < kRounds; ++i) engine_.relay(*alice, TextFrame{"ping " + std::to_string(i)});
    });
    std::thread texts_b([&] {
        for (int i = 0; i < kRounds; ++i) engine_.relay(*bob, FileFrame{FileHeader{std::nullopt, "g", 4}, "\n\n\n\n"});
    });
    files.join();
    texts_a.join();
    texts_b.join();

    auto frames = decode_stream(conn(carol).sent());
    int files_seen = 0, texts_seen = 0;
    for (const auto& frame : frames) {
        if (auto* file = std::get_if<FileFrame>(&frame)) {
            ++files_seen;
            EXPECT_EQ(file->payload, std::string(file->header.size, '\n'));
        } else {
            ++texts_seen;
            EXPECT_EQ(std::get<TextFrame>(frame).line.rfind("[alice] says: ping ", 0), 0u);
        }
    }
    EXPECT_EQ(files_seen, 2 * kRounds);
    EXPECT_EQ(texts_seen, kRounds);
}
