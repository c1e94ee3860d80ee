#include <gtest/gtest.h>
#include "airlink/DiscoveryService.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>
#include <thread>

using namespace airlink;
using namespace std::chrono_literals;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static PeerDescriptor makeDescriptor(const std::string& id, uint16_t port = 9000) {
    PeerDescriptor d;
    d.id = id;
    d.displayName = "Peer " + id;
    d.host = "10.0.0.7";
    d.port = port;
    return d;
}

static SignalingEvent makeEvent(SignalingEventType type, const std::string& from, const std::string& to = "") {
    SignalingEvent e;
    e.type = type;
    e.fromId = from;
    e.toId = to;
    if (type == SignalingEventType::ANNOUNCE) {
        e.peers.push_back(makeDescriptor(from));
    }
    return e;
}

class FakeSignalingChannel : public SignalingChannel {
public:
    bool send(const SignalingEvent& event) override {
        std::lock_guard<std::mutex> lock(mtx);
        sent.push_back(event);
        return true;
    }

    void setHandler(EventHandler h) override {
        std::lock_guard<std::mutex> lock(mtx);
        handler = std::move(h);
    }

    void setDisconnectHandler(DisconnectHandler) override {}

    // Simulates an event arriving from the relay
    void deliver(const SignalingEvent& event) {
        EventHandler h;
        {
            std::lock_guard<std::mutex> lock(mtx);
            h = handler;
        }
        if (h) {
            h(event);
        }
    }

    bool hasHandler() {
        std::lock_guard<std::mutex> lock(mtx);
        return static_cast<bool>(handler);
    }

    std::vector<SignalingEvent> sentOf(SignalingEventType type) {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<SignalingEvent> out;
        std::copy_if(sent.begin(), sent.end(), std::back_inserter(out),
                     [type](const SignalingEvent& e) { return e.type == type; });
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mtx);
        sent.clear();
    }

private:
    std::mutex mtx;
    std::vector<SignalingEvent> sent;
    EventHandler handler;
};

// Long periods so only the explicit calls produce traffic
static DiscoveryConfig quietConfig() {
    DiscoveryConfig cfg;
    cfg.announceInterval = 1h;
    cfg.heartbeatInterval = 1h;
    cfg.pruneInterval = 1h;
    return cfg;
}

class DiscoveryServiceTest : public ::testing::Test {
protected:
    DiscoveryServiceTest()
        : registry("self"),
          discovery(registry, channel, makeDescriptor("self", 8080), quietConfig()) {}

    PeerRegistry registry;
    FakeSignalingChannel channel;
    DiscoveryService discovery;
};

// -----------------------
// LIFECYCLE
// -----------------------
TEST_F(DiscoveryServiceTest, StartAnnouncesSelf) {
    discovery.start();
    EXPECT_TRUE(discovery.isRunning());
    EXPECT_TRUE(channel.hasHandler());

    auto announces = channel.sentOf(SignalingEventType::ANNOUNCE);
    ASSERT_EQ(announces.size(), 1u);
    EXPECT_EQ(announces[0].fromId, "self");
    EXPECT_TRUE(announces[0].toId.empty());
    ASSERT_EQ(announces[0].peers.size(), 1u);
    EXPECT_EQ(announces[0].peers[0].port, 8080);
}

TEST_F(DiscoveryServiceTest, StopBroadcastsOfflineOnce) {
    discovery.start();
    discovery.stop();
    discovery.stop();

    EXPECT_FALSE(discovery.isRunning());
    EXPECT_FALSE(channel.hasHandler());
    auto offline = channel.sentOf(SignalingEventType::OFFLINE);
    ASSERT_EQ(offline.size(), 1u);
    EXPECT_EQ(offline[0].fromId, "self");
}

TEST_F(DiscoveryServiceTest, RestartAfterStop) {
    discovery.start();
    discovery.stop();
    channel.reset();

    discovery.start();
    EXPECT_EQ(channel.sentOf(SignalingEventType::ANNOUNCE).size(), 1u);
    channel.deliver(makeEvent(SignalingEventType::ANNOUNCE, "p1"));
    EXPECT_TRUE(registry.contains("p1"));
}

// -----------------------
// INBOUND EVENTS
// -----------------------
TEST_F(DiscoveryServiceTest, NewcomerAnnounceGetsDirectedReply) {
    discovery.start();
    channel.reset();

    channel.deliver(makeEvent(SignalingEventType::ANNOUNCE, "p1"));
    ASSERT_TRUE(registry.contains("p1"));

    auto replies = channel.sentOf(SignalingEventType::ANNOUNCE);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].toId, "p1");

    // Known peer: refresh only, no second reply
    channel.deliver(makeEvent(SignalingEventType::ANNOUNCE, "p1"));
    EXPECT_EQ(channel.sentOf(SignalingEventType::ANNOUNCE).size(), 1u);
}

TEST_F(DiscoveryServiceTest, OwnEchoAndForeignTrafficIgnored) {
    discovery.handleEvent(makeEvent(SignalingEventType::ANNOUNCE, "self"));
    discovery.handleEvent(makeEvent(SignalingEventType::ANNOUNCE, "p1", "someone-else"));
    discovery.handleEvent(makeEvent(SignalingEventType::ANNOUNCE, ""));

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(channel.sentOf(SignalingEventType::ANNOUNCE).empty());
}

TEST_F(DiscoveryServiceTest, DirectedAnnounceToUsIsApplied) {
    discovery.handleEvent(makeEvent(SignalingEventType::ANNOUNCE, "p1", "self"));
    EXPECT_TRUE(registry.contains("p1"));
}

TEST_F(DiscoveryServiceTest, AnnounceWithoutDescriptorIsDropped) {
    SignalingEvent e = makeEvent(SignalingEventType::ANNOUNCE, "p1");
    e.peers.clear();
    discovery.handleEvent(e);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DiscoveryServiceTest, AnnounceCannotSpeakForOthers) {
    SignalingEvent e = makeEvent(SignalingEventType::ANNOUNCE, "p1");
    e.peers.push_back(makeDescriptor("p9", 9100));
    discovery.handleEvent(e);

    EXPECT_TRUE(registry.contains("p1"));
    EXPECT_FALSE(registry.contains("p9"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(DiscoveryServiceTest, AnnounceCarryingOnlyAnotherPeerChangesNothing) {
    SignalingEvent e = makeEvent(SignalingEventType::ANNOUNCE, "p1");
    e.peers = {makeDescriptor("p9")};
    discovery.handleEvent(e);

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(channel.sentOf(SignalingEventType::ANNOUNCE).empty());
}

TEST_F(DiscoveryServiceTest, PeerListSkipsSelf) {
    SignalingEvent list;
    list.type = SignalingEventType::PEER_LIST;
    list.fromId = "relay";
    list.peers = {makeDescriptor("p1"), makeDescriptor("self"), makeDescriptor("p2")};

    discovery.handleEvent(list);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FALSE(registry.contains("self"));
}

TEST_F(DiscoveryServiceTest, OfflineRemovesPeer) {
    discovery.handleEvent(makeEvent(SignalingEventType::ANNOUNCE, "p1"));
    ASSERT_TRUE(registry.contains("p1"));

    discovery.handleEvent(makeEvent(SignalingEventType::OFFLINE, "p1"));
    EXPECT_FALSE(registry.contains("p1"));
}

TEST_F(DiscoveryServiceTest, HeartbeatRefreshesKnownPeerOnly) {
    const TimePoint past = Clock::now() - 60s;
    registry.upsertFromAnnounce(makeDescriptor("p1"), past);

    discovery.handleEvent(makeEvent(SignalingEventType::HEARTBEAT, "p1"));
    discovery.handleEvent(makeEvent(SignalingEventType::HEARTBEAT, "ghost"));

    auto peer = registry.find("p1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_GT(peer->lastSeen, past);
    EXPECT_EQ(peer->liveness, Liveness::ONLINE);
    EXPECT_FALSE(registry.contains("ghost"));
}

TEST_F(DiscoveryServiceTest, PingIsAnsweredWithMatchingPong) {
    SignalingEvent ping = makeEvent(SignalingEventType::PING, "p1", "self");
    ping.nonce = 0xDEADBEEF;
    discovery.handleEvent(ping);

    auto pongs = channel.sentOf(SignalingEventType::PONG);
    ASSERT_EQ(pongs.size(), 1u);
    EXPECT_EQ(pongs[0].toId, "p1");
    EXPECT_EQ(pongs[0].fromId, "self");
    EXPECT_EQ(pongs[0].nonce, 0xDEADBEEFu);
}

TEST_F(DiscoveryServiceTest, PongRefreshesPeer) {
    const TimePoint past = Clock::now() - 60s;
    registry.upsertFromAnnounce(makeDescriptor("p1"), past);
    discovery.handleEvent(makeEvent(SignalingEventType::PONG, "p1", "self"));
    EXPECT_GT(registry.find("p1")->lastSeen, past);
}

// -----------------------
// TIMERS
// -----------------------
TEST(DiscoveryTimerTest, PeriodicAnnounceAndHeartbeat) {
    PeerRegistry registry("self");
    FakeSignalingChannel channel;
    DiscoveryConfig cfg;
    cfg.announceInterval = 30ms;
    cfg.heartbeatInterval = 30ms;
    cfg.pruneInterval = 1h;

    DiscoveryService discovery(registry, channel, makeDescriptor("self"), cfg);
    discovery.start();
    std::this_thread::sleep_for(400ms);
    discovery.stop();

    EXPECT_GE(channel.sentOf(SignalingEventType::ANNOUNCE).size(), 3u);
    EXPECT_GE(channel.sentOf(SignalingEventType::HEARTBEAT).size(), 2u);

    // Nothing fires once stopped
    const size_t after = channel.sentOf(SignalingEventType::HEARTBEAT).size();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(channel.sentOf(SignalingEventType::HEARTBEAT).size(), after);
}

TEST(DiscoveryTimerTest, PeriodicPruneDropsSilentPeers) {
    RegistryConfig rcfg;
    rcfg.heartbeatWindow = 50ms;
    rcfg.pruneWindow = 100ms;
    PeerRegistry registry("self", rcfg);
    FakeSignalingChannel channel;

    DiscoveryConfig cfg;
    cfg.announceInterval = 1h;
    cfg.heartbeatInterval = 1h;
    cfg.pruneInterval = 20ms;

    DiscoveryService discovery(registry, channel, makeDescriptor("self"), cfg);
    registry.upsertFromAnnounce(makeDescriptor("p1"));
    discovery.start();

    bool pruned = false;
    for (int i = 0; i < 200 && !pruned; ++i) {
        std::this_thread::sleep_for(10ms);
        pruned = !registry.contains("p1");
    }
    discovery.stop();
    EXPECT_TRUE(pruned);
}

// -----------------------
// WIRE CODEC
// -----------------------
TEST(SignalingCodecTest, EventSurvivesFraming) {
    SignalingEvent event = makeEvent(SignalingEventType::ANNOUNCE, "p1", "p2");
    event.nonce = 7;

    Message msg = toMessage(event);
    EXPECT_EQ(msg.type, MessageType::PEER_ANNOUNCE);

    Message parsed;
    ASSERT_TRUE(parseFullMessage(serializeMessage(msg), parsed));

    SignalingEvent decoded;
    ASSERT_TRUE(fromMessage(parsed, decoded));
    EXPECT_EQ(decoded.type, SignalingEventType::ANNOUNCE);
    EXPECT_EQ(decoded.fromId, "p1");
    EXPECT_EQ(decoded.toId, "p2");
    EXPECT_EQ(decoded.nonce, 7u);
    ASSERT_EQ(decoded.peers.size(), 1u);
    EXPECT_EQ(decoded.peers[0].id, "p1");
}

TEST(SignalingCodecTest, TransferFramesAreNotSignaling) {
    SignalingEvent decoded;
    EXPECT_FALSE(fromMessage(makeMessage(MessageType::CHUNK, {0, 0, 0, 0, 0, 0, 0, 0}), decoded));
    EXPECT_FALSE(fromMessage(makeMessage(MessageType::HEARTBEAT, {1, 2}), decoded));
}
