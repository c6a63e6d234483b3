#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "fake_transport.hpp"
#include "file_source.hpp"
#include "node.hpp"

using namespace clouddrop;
using namespace clouddrop::fakes;
using namespace std::chrono_literals;

class PeerNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_ = fast_config();
        alice_ = std::make_unique<TestPeer>(io_, net_, "alice", cfg_);
        bob_ = std::make_unique<TestPeer>(io_, net_, "bob", cfg_);
        alice_->node.set_peer_handler([this](const PeerId& peer, bool joined) {
            peer_events_.push_back((joined ? "+" : "-") + peer);
        });
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
    }

    boost::asio::io_context io_;
    FakeNetwork net_{io_};
    Config cfg_;
    std::unique_ptr<TestPeer> alice_;
    std::unique_ptr<TestPeer> bob_;
    std::vector<std::string> peer_events_;
};

TEST_F(PeerNodeTest, WelcomeSetsIdentityAndRoster) {
    alice_->carrier.set_open(true);
    EXPECT_TRUE(alice_->node.signaling_open());
    alice_->carrier.deliver_raw(R"({"type":"welcome","data":{"peerId":"alice","peers":["alice","bob","carol"]}})");
    ASSERT_TRUE(run_until(io_, [&] { return alice_->node.local_id() == "alice"; }));

    EXPECT_EQ(alice_->node.room_peers(), (std::set<PeerId>{"bob", "carol"}));
    EXPECT_EQ(peer_events_, (std::vector<std::string>{"+bob", "+carol"}));
}

TEST_F(PeerNodeTest, JoinAndLeaveTrackRoster) {
    join_room(io_, *alice_, *bob_);
    peer_events_.clear();

    alice_->carrier.deliver_raw(R"({"type":"peer-joined","data":{"peerId":"carol"}})");
    ASSERT_TRUE(run_until(io_, [&] { return alice_->node.room_peers().count("carol") == 1; }));

    // A join announcing ourselves is not a new peer.
    alice_->carrier.deliver_raw(R"({"type":"peer-joined","data":{"peerId":"alice"}})");
    alice_->carrier.deliver_raw(R"({"type":"peer-left","data":{"peerId":"carol"}})");
    ASSERT_TRUE(run_until(io_, [&] { return alice_->node.room_peers().count("carol") == 0; }));

    EXPECT_EQ(alice_->node.room_peers(), (std::set<PeerId>{"bob"}));
    EXPECT_EQ(peer_events_, (std::vector<std::string>{"+carol", "-carol"}));
}

TEST_F(PeerNodeTest, PeerLeftForgetsSessionAndKey) {
    join_room(io_, *alice_, *bob_);

    bool ready = false;
    alice_->node.connections().ensure_ready("bob", [&](const boost::system::error_code& ec,
                                                       std::shared_ptr<DataChannel>) {
        EXPECT_FALSE(ec) << ec.message();
        ready = true;
    });
    ASSERT_TRUE(run_until(io_, [&] { return ready; }));
    ASSERT_TRUE(alice_->node.secure().has_key("bob"));

    alice_->carrier.deliver_raw(R"({"type":"peer-left","data":{"peerId":"bob"}})");
    ASSERT_TRUE(run_until(io_, [&] { return !alice_->node.connections().has_session("bob"); }));
    EXPECT_FALSE(alice_->node.secure().has_key("bob"));
    EXPECT_FALSE(alice_->node.relay_mode("bob"));
    EXPECT_TRUE(alice_->node.room_peers().empty());
}

TEST_F(PeerNodeTest, SignalWithoutSenderIsDropped) {
    join_room(io_, *alice_, *bob_);
    size_t created = alice_->factory.created.size();

    alice_->carrier.deliver_raw(
        R"({"type":"offer","data":{"sdp":{"type":"offer","sdp":"fake-pc:99"},"publicKey":null}})");
    alice_->carrier.deliver_raw(R"({"type":"relay-data","data":{"type":"text","content":"orphan"}})");
    run_for(io_, 30ms);

    EXPECT_EQ(alice_->factory.created.size(), created);
    EXPECT_TRUE(alice_->node.connections().session_peers().empty());
    EXPECT_EQ(alice_->carrier.count_sent("answer"), 0u);
}

TEST_F(PeerNodeTest, MalformedSignalIsIgnored) {
    join_room(io_, *alice_, *bob_);
    alice_->carrier.deliver_raw("not json at all");
    alice_->carrier.deliver_raw(R"({"type":"mystery","from":"bob","data":{}})");
    run_for(io_, 20ms);
    EXPECT_EQ(alice_->node.room_peers(), (std::set<PeerId>{"bob"}));
}

TEST_F(PeerNodeTest, CarrierLossClearsRoster) {
    join_room(io_, *alice_, *bob_);
    ASSERT_FALSE(alice_->node.room_peers().empty());

    alice_->carrier.set_open(false);
    run_for(io_, 10ms);
    EXPECT_FALSE(alice_->node.signaling_open());
    EXPECT_TRUE(alice_->node.room_peers().empty());
    // The identity survives until the next welcome.
    EXPECT_EQ(alice_->node.local_id(), "alice");
}

TEST_F(PeerNodeTest, FileAndTextEndToEnd) {
    join_room(io_, *alice_, *bob_);

    std::vector<std::string> names;
    std::vector<std::vector<uint8_t>> files;
    std::vector<std::string> texts;
    bob_->node.set_file_received_handler([&](const PeerId& from, const std::string& name,
                                             const std::vector<uint8_t>& data) {
        EXPECT_EQ(from, "alice");
        names.push_back(name);
        files.push_back(data);
    });
    bob_->node.set_text_handler([&](const PeerId& from, const std::string& text) {
        EXPECT_EQ(from, "alice");
        texts.push_back(text);
    });

    std::vector<uint8_t> content(3000);
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<uint8_t>(i % 251);
    bool file_done = false;
    alice_->node.send_file("bob", std::make_shared<MemoryFileSource>("notes.bin", content),
                           [&](const boost::system::error_code& ec, const std::string&) {
        EXPECT_FALSE(ec) << ec.message();
        file_done = true;
    });
    bool text_done = false;
    alice_->node.send_text("bob", "see attached", [&](const boost::system::error_code& ec, const std::string&) {
        EXPECT_FALSE(ec) << ec.message();
        text_done = true;
    });

    ASSERT_TRUE(run_until(io_, [&] { return file_done && text_done && files.size() == 1 && texts.size() == 1; }));
    EXPECT_EQ(names[0], "notes.bin");
    EXPECT_EQ(files[0], content);
    EXPECT_EQ(texts[0], "see attached");
    EXPECT_FALSE(alice_->node.relay_mode("bob"));
}

TEST_F(PeerNodeTest, ServersComeFromDirectory) {
    std::vector<TraversalServer> got;
    bool done = false;
    alice_->node.servers([&](const std::vector<TraversalServer>& s) {
        got = s;
        done = true;
    });
    ASSERT_TRUE(run_until(io_, [&] { return done; }));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].kind, ServerKind::RELAY);
    // start() already warmed the cache.
    EXPECT_EQ(alice_->directory.calls, 1);
}

TEST_F(PeerNodeTest, StopClosesSessions) {
    join_room(io_, *alice_, *bob_);
    bool ready = false;
    alice_->node.connections().ensure_ready("bob", [&](const boost::system::error_code& ec,
                                                       std::shared_ptr<DataChannel>) {
        EXPECT_FALSE(ec) << ec.message();
        ready = true;
    });
    ASSERT_TRUE(run_until(io_, [&] { return ready; }));

    alice_->node.stop();
    EXPECT_TRUE(alice_->node.connections().session_peers().empty());
    EXPECT_FALSE(alice_->node.secure().has_key("bob"));
}

TEST_F(PeerNodeTest, StopAbortsRelayTransfers) {
    join_room(io_, *alice_, *bob_);
    alice_->node.secure().import_peer_key("bob", bob_->node.secure().export_public_key());
    bob_->node.secure().import_peer_key("alice", alice_->node.secure().export_public_key());
    alice_->node.connections().enter_relay_mode("bob", "test");

    bool done = false;
    boost::system::error_code result;
    std::vector<uint8_t> content(400 * 1024, 0x5a);
    alice_->node.send_file("bob", std::make_shared<MemoryFileSource>("big.bin", content),
                           [&](const boost::system::error_code& ec, const std::string&) {
        done = true;
        result = ec;
    });
    ASSERT_TRUE(run_until(io_, [&] { return alice_->carrier.count_sent("relay-data") > 0; }));
    ASSERT_FALSE(done);
    EXPECT_TRUE(alice_->node.connections().session_peers().empty());

    alice_->node.stop();
    EXPECT_TRUE(done);
    EXPECT_EQ(result, boost::asio::error::operation_aborted);
    EXPECT_EQ(alice_->node.transfers().outbound_count(), 0u);
}
