#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <regex>

#include "errors.hpp"
#include "fake_transport.hpp"

using namespace clouddrop;
using namespace clouddrop::fakes;
using namespace std::chrono_literals;

namespace {

struct ReadyResult {
    bool done = false;
    boost::system::error_code ec;
    std::shared_ptr<DataChannel> channel;
};

ConnectionManager::ReadyHandler capture(ReadyResult& r) {
    return [&r](const boost::system::error_code& ec, std::shared_ptr<DataChannel> ch) {
        r.done = true;
        r.ec = ec;
        r.channel = std::move(ch);
    };
}

bool has_status(const std::vector<ConnectionStatus>& v, ConnectionStatus s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_ = fast_config();
    }

    void make_peers() {
        alice_ = std::make_unique<TestPeer>(io_, net_, "alice", cfg_);
        bob_ = std::make_unique<TestPeer>(io_, net_, "bob", cfg_);
        join_room(io_, *alice_, *bob_);
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
    }

    ConnectionManager& alice() { return alice_->node.connections(); }
    ConnectionManager& bob() { return bob_->node.connections(); }

    boost::asio::io_context io_;
    FakeNetwork net_{io_};
    Config cfg_;
    std::unique_ptr<TestPeer> alice_;
    std::unique_ptr<TestPeer> bob_;
};

TEST(PolitenessTest, SmallerIdIsPolite) {
    EXPECT_TRUE(ConnectionManager::is_polite("alice", "bob"));
    EXPECT_FALSE(ConnectionManager::is_polite("bob", "alice"));
    EXPECT_TRUE(ConnectionManager::is_polite("", "alice"));
}

TEST_F(ConnectionManagerTest, EnsureReadyConnectsBothSides) {
    make_peers();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));

    EXPECT_FALSE(r.ec) << r.ec.message();
    ASSERT_TRUE(r.channel);
    EXPECT_EQ(r.channel->state(), ChannelState::OPEN);
    EXPECT_EQ(r.channel->label(), ConnectionManager::kChannelLabel);
    EXPECT_TRUE(alice_->node.secure().has_key("bob"));
    EXPECT_FALSE(alice().relay_mode("bob"));

    ASSERT_TRUE(run_until(io_, [&] { return bob().open_channel("alice") != nullptr; }));
    EXPECT_TRUE(bob_->node.secure().has_key("alice"));

    EXPECT_TRUE(has_status(alice_->statuses, ConnectionStatus::CONNECTING));
    EXPECT_TRUE(has_status(alice_->statuses, ConnectionStatus::CONNECTED));
    EXPECT_EQ(alice_->carrier.count_sent("offer"), 1u);
    EXPECT_EQ(bob_->carrier.count_sent("answer"), 1u);
}

TEST_F(ConnectionManagerTest, ServersFromSelectorReachTheConnection) {
    make_peers();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    ASSERT_TRUE(alice_->pc());
    ASSERT_EQ(alice_->pc()->servers().size(), 1u);
    EXPECT_EQ(alice_->pc()->servers()[0].kind, ServerKind::RELAY);
}

TEST_F(ConnectionManagerTest, ReadyPeerAnswersImmediately) {
    make_peers();
    ReadyResult first;
    alice().ensure_ready("bob", capture(first));
    ASSERT_TRUE(run_until(io_, [&] { return first.done; }));

    ReadyResult second;
    alice().ensure_ready("bob", capture(second));
    EXPECT_FALSE(second.done);  // never inline
    ASSERT_TRUE(run_until(io_, [&] { return second.done; }));
    EXPECT_FALSE(second.ec);
    EXPECT_EQ(second.channel, first.channel);
    EXPECT_EQ(alice_->factory.created.size(), 1u);
    EXPECT_EQ(alice_->pc()->offers(), 1);
}

TEST_F(ConnectionManagerTest, ConcurrentCallersShareOneNegotiation) {
    make_peers();
    ReadyResult a, b;
    alice().ensure_ready("bob", capture(a));
    alice().ensure_ready("bob", capture(b));
    ASSERT_TRUE(run_until(io_, [&] { return a.done && b.done; }));

    EXPECT_FALSE(a.ec);
    EXPECT_FALSE(b.ec);
    EXPECT_EQ(a.channel, b.channel);
    EXPECT_EQ(alice_->factory.created.size(), 1u);
    EXPECT_EQ(alice_->carrier.count_sent("offer"), 1u);
}

TEST_F(ConnectionManagerTest, GlareResolvedByPoliteSide) {
    make_peers();
    ReadyResult a, b;
    alice().ensure_ready("bob", capture(a));
    bob().ensure_ready("alice", capture(b));
    ASSERT_TRUE(run_until(io_, [&] { return a.done && b.done; }));

    EXPECT_FALSE(a.ec) << a.ec.message();
    EXPECT_FALSE(b.ec) << b.ec.message();
    EXPECT_EQ(alice_->factory.created.size(), 1u);
    EXPECT_EQ(bob_->factory.created.size(), 1u);
    // Alice is polite and answers; bob's offer wins.
    EXPECT_EQ(alice_->carrier.count_sent("answer"), 1u);
    EXPECT_EQ(bob_->carrier.count_sent("answer"), 0u);
    EXPECT_FALSE(alice().relay_mode("bob"));
    EXPECT_FALSE(bob().relay_mode("alice"));

    ASSERT_TRUE(a.channel && b.channel);
    std::optional<std::string> got;
    bob().set_channel_text_handler([&](const PeerId&, const std::string& t) { got = t; });
    EXPECT_TRUE(a.channel->send_text("ping"));
    ASSERT_TRUE(run_until(io_, [&] { return got.has_value(); }));
    EXPECT_EQ(*got, "ping");
}

TEST_F(ConnectionManagerTest, CandidatesBufferedUntilRemoteDescription) {
    make_peers();
    alice().handle_remote_candidate("bob", IceCandidate{"candidate:early", "0", 0});
    EXPECT_TRUE(alice().has_session("bob"));

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    ASSERT_FALSE(r.ec);
    // The buffered one plus the answerer's own.
    ASSERT_TRUE(run_until(io_, [&] { return alice_->pc()->candidates_added() == 2; }));
}

TEST_F(ConnectionManagerTest, ChannelTimeoutSwitchesToRelay) {
    cfg_.connect_timeout_ms = 200;
    cfg_.slow_hint_ms = 50;
    net_.hang = true;
    make_peers();

    auto start = std::chrono::steady_clock::now();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));

    EXPECT_EQ(r.ec, make_error_code(Errc::channel_timeout));
    EXPECT_FALSE(r.channel);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_TRUE(alice().relay_mode("bob"));

    auto slow = std::find(alice_->statuses.begin(), alice_->statuses.end(), ConnectionStatus::SLOW);
    auto relay = std::find(alice_->statuses.begin(), alice_->statuses.end(), ConnectionStatus::RELAY);
    ASSERT_NE(slow, alice_->statuses.end());
    ASSERT_NE(relay, alice_->statuses.end());
    EXPECT_LT(slow, relay);
}

TEST_F(ConnectionManagerTest, MissingKeyTimesOutWithKeyError) {
    cfg_.connect_timeout_ms = 200;
    make_peers();
    // Bob's answer arrives without its public key.
    bob_->carrier.rewrite = [](const std::string& json) {
        static const std::regex key("\"publicKey\":\"[^\"]*\",?");
        return std::regex_replace(json, key, "");
    };

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));

    EXPECT_EQ(r.ec, make_error_code(Errc::encryption_key_timeout));
    EXPECT_FALSE(alice_->node.secure().has_key("bob"));
    EXPECT_TRUE(alice().relay_mode("bob"));
}

TEST_F(ConnectionManagerTest, FailedCheckIsRestarted) {
    net_.fail_rounds = 1;
    make_peers();

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));

    EXPECT_FALSE(r.ec) << r.ec.message();
    EXPECT_GE(net_.rounds, 2);
    EXPECT_GE(alice_->pc()->restart_offers() + bob_->pc()->restart_offers(), 1);
    EXPECT_EQ(alice().restart_count("bob"), 0u);
    EXPECT_FALSE(alice().relay_mode("bob"));
}

TEST_F(ConnectionManagerTest, RestartBudgetExhaustedGivesUp) {
    net_.blocked = true;
    make_peers();

    auto start = std::chrono::steady_clock::now();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));

    EXPECT_EQ(r.ec, make_error_code(Errc::connect_failed));
    // Fails fast, well before the connect timeout.
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(cfg_.connect_timeout_ms));
    EXPECT_TRUE(alice().relay_mode("bob"));
    EXPECT_FALSE(alice().has_session("bob"));
    // Relay traffic is still encrypted with the negotiated key.
    EXPECT_TRUE(alice_->node.secure().has_key("bob"));
    EXPECT_TRUE(has_status(alice_->statuses, ConnectionStatus::RELAY));
}

TEST_F(ConnectionManagerTest, FactoryFailureGoesStraightToRelay) {
    make_peers();
    alice_->factory.fail_create = true;

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    EXPECT_EQ(r.ec, make_error_code(Errc::connect_failed));
    EXPECT_TRUE(alice().relay_mode("bob"));
    EXPECT_EQ(alice_->carrier.count_sent("offer"), 0u);
}

TEST_F(ConnectionManagerTest, ShortDisconnectIsTolerated) {
    make_peers();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    ASSERT_FALSE(r.ec);

    auto pc = alice_->pc();
    pc->set_ice_pair(IceState::DISCONNECTED);
    run_for(io_, 20ms);
    pc->set_ice_pair(IceState::CONNECTED);
    run_for(io_, std::chrono::milliseconds(cfg_.disconnect_grace_ms * 2));

    EXPECT_EQ(pc->restart_offers(), 0);
    EXPECT_EQ(bob_->pc()->restart_offers(), 0);
    EXPECT_TRUE(alice().open_channel("bob"));
}

TEST_F(ConnectionManagerTest, LongDisconnectTriggersRestart) {
    make_peers();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    ASSERT_FALSE(r.ec);

    auto pc = alice_->pc();
    int rounds = net_.rounds;
    pc->set_ice_pair(IceState::DISCONNECTED);
    ASSERT_TRUE(run_until(io_, [&] { return net_.rounds > rounds && pc->ice_state() == IceState::CONNECTED; }));

    EXPECT_GE(pc->restart_offers() + bob_->pc()->restart_offers(), 1);
    EXPECT_EQ(alice_->factory.created.size(), 1u);
    EXPECT_FALSE(alice().relay_mode("bob"));
}

TEST_F(ConnectionManagerTest, CloseAbortsPendingAndForgetsPeer) {
    net_.hang = true;
    make_peers();

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return alice_->node.secure().has_key("bob"); }));

    alice().enter_relay_mode("bob", "test");
    alice().close("bob");
    ASSERT_TRUE(r.done);
    EXPECT_EQ(r.ec, boost::asio::error::operation_aborted);
    EXPECT_FALSE(alice().has_session("bob"));
    EXPECT_FALSE(alice().relay_mode("bob"));
    EXPECT_FALSE(alice_->node.secure().has_key("bob"));
}

TEST_F(ConnectionManagerTest, RemoteCloseTearsDownButKeepsKey) {
    make_peers();
    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    ASSERT_FALSE(r.ec);

    alice_->pc()->channel()->remote_close();
    EXPECT_FALSE(alice().has_session("bob"));
    EXPECT_TRUE(alice_->node.secure().has_key("bob"));
    EXPECT_FALSE(alice().relay_mode("bob"));

    ReadyResult again;
    alice().ensure_ready("bob", capture(again));
    ASSERT_TRUE(run_until(io_, [&] { return again.done; }));
    EXPECT_FALSE(again.ec) << again.ec.message();
    EXPECT_EQ(alice_->factory.created.size(), 2u);
}

TEST_F(ConnectionManagerTest, OpeningChannelLeavesRelayMode) {
    make_peers();
    alice().enter_relay_mode("bob", "test");
    ASSERT_TRUE(alice().relay_mode("bob"));

    ReadyResult r;
    alice().ensure_ready("bob", capture(r));
    ASSERT_TRUE(run_until(io_, [&] { return r.done; }));
    EXPECT_FALSE(r.ec);
    EXPECT_FALSE(alice().relay_mode("bob"));
}
