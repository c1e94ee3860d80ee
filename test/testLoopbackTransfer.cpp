#include <gtest/gtest.h>
#include "airlink/TransferCoordinator.hpp"
#include "airlink/TransferServer.hpp"
#include "airlink/SignalingChannel.hpp"
#include <filesystem>
#include <fstream>
#include <future>
#include <atomic>
#include <iterator>
#include <random>
#include <thread>

using namespace airlink;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
template <typename Pred>
static bool waitFor(Pred pred, std::chrono::milliseconds timeout = 10000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

static void writeRandomFile(const fs::path& path, size_t size, unsigned seed) {
    std::mt19937 gen(seed);
    std::vector<char> data(size);
    for (auto& c : data) {
        c = static_cast<char>(gen() & 0xFF);
    }
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static std::vector<char> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static uint16_t closedPort() {
    boost::asio::io_context ctx;
    tcp::acceptor acceptor(ctx, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

class LoopbackTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("airlink_loopback_" + std::to_string(rd()));
        for (const char* dir : {"client/downloads", "client/shared", "server/downloads", "server/shared"}) {
            fs::create_directories(root / dir);
        }

        serverResources = std::make_unique<FileResourceProvider>(
            (root / "server/downloads").string(), (root / "server/shared").string());
        clientResources = std::make_unique<FileResourceProvider>(
            (root / "client/downloads").string(), (root / "client/shared").string());

        server = std::make_unique<TransferServer>(*serverResources, 0);
        server->setCompletionHandler([this](const IncomingTransfer& t) {
            std::lock_guard<std::mutex> lock(completionMtx);
            completions.push_back(t);
        });
        server->start();

        registry = std::make_unique<PeerRegistry>("client");
        PeerDescriptor d;
        d.id = "server";
        d.displayName = "Server";
        d.host = "127.0.0.1";
        d.port = server->port();
        ASSERT_TRUE(registry->upsertFromAnnounce(d));

        CoordinatorConfig cfg;
        cfg.connectTimeout = 3000ms;
        cfg.probeTimeout = 1000ms;
        coordinator = std::make_unique<TransferCoordinator>(*registry, transport, *clientResources, history, cfg);
    }

    void TearDown() override {
        coordinator->shutdown();
        server->stop();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    TransferState stateOf(const std::string& id) {
        auto record = coordinator->find(id);
        return record ? record->state : TransferState::PENDING;
    }

    bool waitForTerminal(const std::string& id) {
        return waitFor([&]() { return isTerminalState(stateOf(id)); });
    }

    std::vector<IncomingTransfer> serverCompletions() {
        std::lock_guard<std::mutex> lock(completionMtx);
        return completions;
    }

    fs::path root;
    std::unique_ptr<FileResourceProvider> serverResources;
    std::unique_ptr<FileResourceProvider> clientResources;
    std::unique_ptr<TransferServer> server;
    std::unique_ptr<PeerRegistry> registry;
    TcpPeerTransport transport;
    MemoryTransferHistory history;
    std::unique_ptr<TransferCoordinator> coordinator;

    std::mutex completionMtx;
    std::vector<IncomingTransfer> completions;
};

// -----------------------
// TRANSFERS
// -----------------------
TEST_F(LoopbackTransferTest, PushDeliversIdenticalFile) {
    writeRandomFile(root / "client/shared/payload.bin", 300000, 1);

    ResourceDescriptor d;
    d.name = "payload.bin";
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "client", "server", TransferDirection::OUTBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));

    auto record = coordinator->find(id);
    ASSERT_EQ(record->state, TransferState::COMPLETED) << record->lastError;
    EXPECT_EQ(record->bytesTransferred, 300000u);

    ASSERT_TRUE(waitFor([&]() { return !serverCompletions().empty(); }));
    auto incoming = serverCompletions()[0];
    EXPECT_TRUE(incoming.success);
    EXPECT_EQ(incoming.transferId, id);
    EXPECT_EQ(incoming.peerId, "client");
    EXPECT_EQ(incoming.direction, TransferDirection::INBOUND);

    EXPECT_EQ(readFile(root / "server/downloads/payload.bin"), readFile(root / "client/shared/payload.bin"));
    EXPECT_FALSE(fs::exists(root / "server/downloads/payload.bin.part"));
}

TEST_F(LoopbackTransferTest, PullDeliversIdenticalFile) {
    writeRandomFile(root / "server/shared/remote.bin", 200000, 2);

    ResourceDescriptor d;
    d.name = "remote.bin";
    d.totalSizeBytes = 200000;
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "server", "client", TransferDirection::INBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));

    auto record = coordinator->find(id);
    ASSERT_EQ(record->state, TransferState::COMPLETED) << record->lastError;
    EXPECT_EQ(readFile(root / "client/downloads/remote.bin"), readFile(root / "server/shared/remote.bin"));

    ASSERT_TRUE(waitFor([&]() { return !serverCompletions().empty(); }));
    EXPECT_EQ(serverCompletions()[0].direction, TransferDirection::OUTBOUND);
}

TEST_F(LoopbackTransferTest, PullWithWrongSizeFails) {
    writeRandomFile(root / "server/shared/remote.bin", 1000, 3);

    ResourceDescriptor d;
    d.name = "remote.bin";
    d.totalSizeBytes = 999;
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "server", "client", TransferDirection::INBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));

    auto record = coordinator->find(id);
    EXPECT_EQ(record->state, TransferState::FAILED);
    EXPECT_EQ(record->errorKind, ErrorKind::IO);
    EXPECT_FALSE(fs::exists(root / "client/downloads/remote.bin"));
}

TEST_F(LoopbackTransferTest, PullOfUnsharedFileFails) {
    ResourceDescriptor d;
    d.name = "secret.bin";
    d.totalSizeBytes = 10;
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "server", "client", TransferDirection::INBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));

    auto record = coordinator->find(id);
    EXPECT_EQ(record->state, TransferState::FAILED);
    EXPECT_NE(record->lastError.find("Not shared"), std::string::npos) << record->lastError;
}

TEST_F(LoopbackTransferTest, RejectedOfferFails) {
    server->setIncomingPolicy([](const TransferOffer&, std::string& reason) {
        reason = "busy";
        return false;
    });
    writeRandomFile(root / "client/shared/payload.bin", 5000, 4);

    ResourceDescriptor d;
    d.name = "payload.bin";
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "client", "server", TransferDirection::OUTBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));

    auto record = coordinator->find(id);
    EXPECT_EQ(record->state, TransferState::FAILED);
    EXPECT_EQ(record->errorKind, ErrorKind::IO);
    EXPECT_NE(record->lastError.find("busy"), std::string::npos) << record->lastError;
    EXPECT_FALSE(fs::exists(root / "server/downloads/payload.bin"));
}

TEST_F(LoopbackTransferTest, PauseResumeKeepsFileIntact) {
    writeRandomFile(root / "client/shared/large.bin", 8 * 1024 * 1024, 5);

    ResourceDescriptor d;
    d.name = "large.bin";
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "client", "server", TransferDirection::OUTBOUND, id), OpStatus::OK);

    // Pausing only applies once active; a fast link may finish first
    bool paused = false;
    waitFor([&]() {
        paused = coordinator->pause(id) == OpStatus::OK;
        return paused || isTerminalState(stateOf(id));
    });

    if (paused) {
        std::this_thread::sleep_for(200ms);
        EXPECT_EQ(stateOf(id), TransferState::PAUSED);
        EXPECT_EQ(server->activeSessions(), 1u);
        ASSERT_EQ(coordinator->resume(id), OpStatus::OK);
    }

    ASSERT_TRUE(waitForTerminal(id));
    ASSERT_EQ(stateOf(id), TransferState::COMPLETED);
    ASSERT_TRUE(waitFor([&]() { return !serverCompletions().empty(); }));
    EXPECT_TRUE(serverCompletions()[0].success);
    EXPECT_EQ(readFile(root / "server/downloads/large.bin"), readFile(root / "client/shared/large.bin"));
}

TEST_F(LoopbackTransferTest, CancelledPushLeavesNoPartialFile) {
    writeRandomFile(root / "client/shared/large.bin", 16 * 1024 * 1024, 6);

    ResourceDescriptor d;
    d.name = "large.bin";
    std::string id;
    ASSERT_EQ(coordinator->initiate(d, "client", "server", TransferDirection::OUTBOUND, id), OpStatus::OK);

    bool cancelled = false;
    waitFor([&]() {
        cancelled = stateOf(id) == TransferState::ACTIVE && coordinator->cancel(id) == OpStatus::OK;
        return cancelled || isTerminalState(stateOf(id));
    });

    if (cancelled) {
        ASSERT_TRUE(waitFor([&]() { return !serverCompletions().empty(); }));
        EXPECT_FALSE(serverCompletions()[0].success);
        EXPECT_FALSE(fs::exists(root / "server/downloads/large.bin"));
        EXPECT_FALSE(fs::exists(root / "server/downloads/large.bin.part"));
    }
}

// -----------------------
// REACHABILITY
// -----------------------
TEST_F(LoopbackTransferTest, PingAnsweredByServer) {
    auto result = coordinator->probe("server");
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(result.get());
    EXPECT_TRUE(registry->contains("server"));
}

TEST_F(LoopbackTransferTest, PingToDeadPortMarksOffline) {
    PeerDescriptor d;
    d.id = "dead";
    d.displayName = "Dead";
    d.host = "127.0.0.1";
    d.port = closedPort();
    ASSERT_TRUE(registry->upsertFromAnnounce(d));

    auto result = coordinator->probe("dead");
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_FALSE(registry->contains("dead"));
}

TEST_F(LoopbackTransferTest, ConnectRefusedIsIoFailure) {
    PeerDescriptor d;
    d.id = "dead";
    d.displayName = "Dead";
    d.host = "127.0.0.1";
    d.port = closedPort();
    ASSERT_TRUE(registry->upsertFromAnnounce(d));
    writeRandomFile(root / "client/shared/payload.bin", 100, 7);

    ResourceDescriptor r;
    r.name = "payload.bin";
    std::string id;
    ASSERT_EQ(coordinator->initiate(r, "client", "dead", TransferDirection::OUTBOUND, id), OpStatus::OK);
    ASSERT_TRUE(waitForTerminal(id));
    EXPECT_EQ(stateOf(id), TransferState::FAILED);
    EXPECT_EQ(coordinator->find(id)->errorKind, ErrorKind::IO);
}

// -----------------------
// FRAME CONNECTION
// -----------------------
class FrameConnectionPairTest : public ::testing::Test {
protected:
    void SetUp() override {
        guard = std::make_unique<WorkGuard>(io.get_executor());
        tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        server = std::make_shared<FrameConnection>(io);
        client = std::make_shared<FrameConnection>(io);

        client->socket().connect(acceptor.local_endpoint());
        acceptor.accept(server->socket());

        server->setMessageHandler([this](const Message& m) {
            std::lock_guard<std::mutex> lock(mtx);
            received.push_back(m.type);
        });
        server->start();
        client->start();
        ioThread = std::thread([this]() { io.run(); });
    }

    void TearDown() override {
        client->close();
        server->close();
        guard.reset();
        ioThread.join();
    }

    size_t receivedCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return received.size();
    }

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context io;
    std::unique_ptr<WorkGuard> guard;
    std::thread ioThread;
    FrameConnection::Ptr server;
    FrameConnection::Ptr client;
    std::mutex mtx;
    std::vector<MessageType> received;
};

TEST_F(FrameConnectionPairTest, WriteCallbackRunsOnceFrameIsSent) {
    std::promise<void> written;
    client->sendMessage(makeMessage(MessageType::PING, {}), [&written]() { written.set_value(); });

    auto future = written.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    ASSERT_TRUE(waitFor([&]() { return receivedCount() == 1; }));
}

TEST_F(FrameConnectionPairTest, WriteCallbackDroppedAfterClose) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    client->close("done");
    client->sendMessage(makeMessage(MessageType::PING, {}), [calls]() { ++*calls; });

    ASSERT_TRUE(waitFor([&]() { return !client->isConnected(); }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls->load(), 0);
    EXPECT_EQ(receivedCount(), 0u);
}

// -----------------------
// SIGNALING OVER TCP
// -----------------------
TEST(TcpSignalingChannelTest, ExchangesEventsWithRelay) {
    boost::asio::io_context relayIo;
    auto guard = boost::asio::make_work_guard(relayIo);
    tcp::acceptor acceptor(relayIo, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const uint16_t port = acceptor.local_endpoint().port();

    auto relayConn = std::make_shared<FrameConnection>(relayIo);
    std::promise<Message> relayGot;
    std::atomic<bool> relayGotOne{false};
    acceptor.async_accept(relayConn->socket(), [&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        relayConn->setMessageHandler([&](const Message& m) {
            if (!relayGotOne.exchange(true)) {
                relayGot.set_value(m);
            }
        });
        relayConn->start();
    });
    std::thread relayThread([&relayIo]() { relayIo.run(); });

    TcpSignalingChannel channel;
    std::promise<SignalingEvent> clientGot;
    std::promise<void> disconnected;
    channel.setHandler([&](const SignalingEvent& e) { clientGot.set_value(e); });
    channel.setDisconnectHandler([&](const std::string&) { disconnected.set_value(); });

    EXPECT_FALSE(channel.send(SignalingEvent()));
    ASSERT_TRUE(channel.connect("127.0.0.1", port, 2000ms));
    EXPECT_TRUE(channel.isConnected());

    // client -> relay
    SignalingEvent announce;
    announce.type = SignalingEventType::ANNOUNCE;
    announce.fromId = "client";
    PeerDescriptor self;
    self.id = "client";
    self.displayName = "Client";
    self.host = "127.0.0.1";
    self.port = 9000;
    announce.peers.push_back(self);
    ASSERT_TRUE(channel.send(announce));

    auto relayFuture = relayGot.get_future();
    ASSERT_EQ(relayFuture.wait_for(5s), std::future_status::ready);
    SignalingEvent seenByRelay;
    ASSERT_TRUE(fromMessage(relayFuture.get(), seenByRelay));
    EXPECT_EQ(seenByRelay.type, SignalingEventType::ANNOUNCE);
    EXPECT_EQ(seenByRelay.fromId, "client");

    // relay -> client
    SignalingEvent list;
    list.type = SignalingEventType::PEER_LIST;
    list.fromId = "relay";
    list.peers.push_back(self);
    relayConn->sendMessage(toMessage(list));

    auto clientFuture = clientGot.get_future();
    ASSERT_EQ(clientFuture.wait_for(5s), std::future_status::ready);
    SignalingEvent seenByClient = clientFuture.get();
    EXPECT_EQ(seenByClient.type, SignalingEventType::PEER_LIST);
    ASSERT_EQ(seenByClient.peers.size(), 1u);
    EXPECT_EQ(seenByClient.peers[0].id, "client");

    // relay hangs up
    relayConn->close("bye");
    auto disconnectFuture = disconnected.get_future();
    ASSERT_EQ(disconnectFuture.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(channel.isConnected());

    boost::asio::post(relayIo, [&acceptor]() {
        boost::system::error_code ec;
        acceptor.close(ec);
    });
    guard.reset();
    relayThread.join();
}

TEST(TcpSignalingChannelTest, ConnectToClosedPortFails) {
    TcpSignalingChannel channel;
    EXPECT_FALSE(channel.connect("127.0.0.1", closedPort(), 1000ms));
    EXPECT_FALSE(channel.isConnected());
}
