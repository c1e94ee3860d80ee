#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <signal.h>

#include "airlink/Types.hpp"
#include "airlink/Random.hpp"
#include "airlink/PeerRegistry.hpp"
#include "airlink/ResourceIO.hpp"
#include "airlink/TransferHistory.hpp"
#include "airlink/PeerTransport.hpp"
#include "airlink/TransferCoordinator.hpp"
#include "airlink/TransferServer.hpp"
#include "airlink/SignalingChannel.hpp"
#include "airlink/DiscoveryService.hpp"

using namespace std;
namespace fs = std::filesystem;

static atomic<bool> g_running(true);

void signal_handler(int signum){
    (void)signum;
    g_running = false;
}

// Reuses the id stored in the data directory so peers see a stable identity across restarts
static string loadOrCreatePeerId(const string& datadir) {
    const fs::path idFile = fs::path(datadir) / "peer_id";
    {
        ifstream in(idFile);
        string id;
        if (in >> id && !id.empty() && id.size() <= airlink::MAX_ID_LENGTH) {
            return id;
        }
    }

    string id = airlink::Random::peerId();
    ofstream out(idFile, ios::trunc);
    if (!out.is_open() || !(out << id << '\n')) {
        cerr << "Warning: Could not persist peer id to " << idFile << endl;
    }
    return id;
}

// Address other peers should use to reach us: the interface that routes to the relay
static string localAddressToward(const string& host, uint16_t port) {
    boost::system::error_code ec;
    boost::asio::io_context ctx;
    boost::asio::ip::udp::resolver resolver(ctx);
    auto endpoints = resolver.resolve(host, to_string(port), ec);
    if (ec || endpoints.empty()) {
        return "127.0.0.1";
    }

    boost::asio::ip::udp::socket probe(ctx);
    probe.connect(*endpoints.begin(), ec);
    if (ec) {
        return "127.0.0.1";
    }

    auto local = probe.local_endpoint(ec);
    return ec ? "127.0.0.1" : local.address().to_string();
}

static airlink::TransferRecord toRecord(const airlink::IncomingTransfer& incoming, const string& localId) {
    airlink::TransferRecord record;
    record.id = incoming.transferId;
    record.direction = incoming.direction;
    record.peerId = incoming.peerId;
    if (incoming.direction == airlink::TransferDirection::INBOUND) {
        record.fromPeerId = incoming.peerId;
        record.toPeerId = localId;
    } else {
        record.fromPeerId = localId;
        record.toPeerId = incoming.peerId;
    }
    record.resource = incoming.resource;
    record.bytesTransferred = incoming.bytesTransferred;
    record.chunkSize = airlink::chunkSizeFor(incoming.resource.totalSizeBytes);
    record.state = incoming.success ? airlink::TransferState::COMPLETED : airlink::TransferState::FAILED;
    record.errorKind = incoming.success ? airlink::ErrorKind::NONE : airlink::ErrorKind::IO;
    record.lastError = incoming.error;
    record.endedAt = airlink::Clock::now();
    return record;
}

static void printHelp() {
    cout << "Commands:\n"
         << "  peers                        list discovered peers\n"
         << "  send <peerId> <path>         push a file to a peer\n"
         << "  pull <peerId> <name> <size>  fetch a shared file from a peer\n"
         << "  transfers                    list transfers\n"
         << "  pause|resume|cancel|retry|remove <transferId>\n"
         << "  clear                        forget finished transfers\n"
         << "  history [clear]              show or wipe the transfer history\n"
         << "  probe <peerId>               ping a peer\n"
         << "  stats                        transfer statistics\n"
         << "  quit" << endl;
}

static void printTransfers(const airlink::TransferCoordinator& coordinator) {
    for (const auto& record : coordinator.allTransfers()) {
        cout << "  " << record.id << " " << airlink::transferDirectionToString(record.direction)
             << " " << record.resource.name << " " << airlink::transferStateToString(record.state)
             << " " << record.bytesTransferred << "/" << record.resource.totalSizeBytes;
        if (!record.lastError.empty()) {
            cout << " (" << airlink::errorKindToString(record.errorKind) << ": " << record.lastError << ")";
        }
        cout << endl;
    }
}

static void runCommand(const string& line,
                       airlink::PeerRegistry& registry,
                       airlink::TransferCoordinator& coordinator,
                       airlink::FileTransferHistory& history) {
    istringstream in(line);
    string command;
    in >> command;
    if (command.empty()) {
        return;
    }

    const string localId = registry.localPeerId();

    if (command == "help") {
        printHelp();
    } else if (command == "quit" || command == "exit") {
        g_running = false;
    } else if (command == "peers") {
        for (const auto& peer : registry.snapshot()) {
            cout << "  " << peer.id << " " << peer.displayName << " " << peer.address()
                 << " " << airlink::platformClassToString(peer.platform)
                 << " " << airlink::livenessToString(peer.liveness) << endl;
        }
    } else if (command == "send") {
        string peerId, path;
        in >> peerId >> path;
        airlink::ResourceDescriptor resource;
        resource.path = path;
        resource.name = fs::path(path).filename().string();
        string id;
        auto status = coordinator.initiate(resource, localId, peerId, airlink::TransferDirection::OUTBOUND, id);
        cout << (status == airlink::OpStatus::OK ? "Started " + id : airlink::opStatusToString(status)) << endl;
    } else if (command == "pull") {
        string peerId, name;
        uint64_t size = 0;
        in >> peerId >> name >> size;
        airlink::ResourceDescriptor resource;
        resource.name = name;
        resource.totalSizeBytes = size;
        string id;
        auto status = coordinator.initiate(resource, peerId, localId, airlink::TransferDirection::INBOUND, id);
        cout << (status == airlink::OpStatus::OK ? "Started " + id : airlink::opStatusToString(status)) << endl;
    } else if (command == "transfers") {
        printTransfers(coordinator);
    } else if (command == "pause" || command == "resume" || command == "cancel" ||
               command == "retry" || command == "remove") {
        string id;
        in >> id;
        airlink::OpStatus status = airlink::OpStatus::NOT_FOUND;
        if (command == "pause") status = coordinator.pause(id);
        else if (command == "resume") status = coordinator.resume(id);
        else if (command == "cancel") status = coordinator.cancel(id);
        else if (command == "retry") status = coordinator.retry(id);
        else status = coordinator.remove(id);
        cout << airlink::opStatusToString(status) << endl;
    } else if (command == "clear") {
        cout << "Removed " << coordinator.clearFinished() << " transfer(s)" << endl;
    } else if (command == "history") {
        string sub;
        in >> sub;
        if (sub == "clear") {
            cout << (history.clear() ? "History cleared" : "Failed to clear history") << endl;
        } else {
            for (const auto& record : history.load()) {
                cout << "  " << record.id << " " << airlink::transferDirectionToString(record.direction)
                     << " " << record.resource.name << " " << airlink::transferStateToString(record.state)
                     << " " << record.bytesTransferred << "/" << record.resource.totalSizeBytes << endl;
            }
        }
    } else if (command == "probe") {
        string peerId;
        in >> peerId;
        auto reachable = coordinator.probe(peerId);
        cout << (reachable.get() ? "reachable" : "unreachable") << endl;
    } else if (command == "stats") {
        auto stats = coordinator.statistics();
        cout << "  total=" << stats.total << " completed=" << stats.completed
             << " failed=" << stats.failed << " cancelled=" << stats.cancelled
             << " bytes=" << stats.completedBytes
             << " successRate=" << stats.successRate
             << " avgSpeed=" << stats.averageSpeed << " B/s" << endl;
    } else {
        cout << "Unknown command '" << command << "', try help" << endl;
    }
}

int main(int argc, char** argv) {
    string datadir = "./airlink_data";
    uint16_t port = airlink::DEFAULT_TRANSFER_PORT;
    string displayName = "airlink";
    string signalingAddress;

    if (argc > 1) datadir = argv[1];
    if (argc > 2) port = static_cast<uint16_t>(atoi(argv[2]));
    if (argc > 3) displayName = argv[3];
    if (argc > 4) signalingAddress = argv[4];

    cout << "Airlink daemon starting. datadir=" << datadir << " port=" << port << endl;

    if (!airlink::Random::initialize()) {
        cerr << "Failed to initialize crypto (sodium)." << endl;
        return 1;
    }

    const string downloadDir = (fs::path(datadir) / "downloads").string();
    const string sharedDir = (fs::path(datadir) / "shared").string();
    try {
        fs::create_directories(downloadDir);
        fs::create_directories(sharedDir);
    } catch (const fs::filesystem_error& e) {
        cerr << "Failed to prepare data directory " << datadir << ": " << e.what() << endl;
        return 1;
    }

    airlink::FileTransferHistory history(datadir);
    if (!history.initialize()) {
        cerr << "Failed to initialize transfer history at " << datadir << endl;
        return 1;
    }

    const string localId = loadOrCreatePeerId(datadir);
    airlink::FileResourceProvider resources(downloadDir, sharedDir);
    airlink::PeerRegistry registry(localId);

    registry.subscribe([](const airlink::PeerEvent& event) {
        const char* what = event.type == airlink::PeerEventType::ADDED ? "joined"
                         : event.type == airlink::PeerEventType::REMOVED ? "left" : "updated";
        cout << "Info: Peer " << event.peer.displayName << " (" << event.peer.id << ") " << what
             << ", " << airlink::livenessToString(event.peer.liveness) << endl;
    });

    unique_ptr<airlink::TransferServer> server;
    try {
        server = make_unique<airlink::TransferServer>(resources, port);
    } catch (const std::exception& e) {
        cerr << "Failed to listen on port " << port << ": " << e.what() << endl;
        return 1;
    }
    server->setCompletionHandler([&history, localId](const airlink::IncomingTransfer& incoming) {
        if (!history.append(toRecord(incoming, localId))) {
            cerr << "Warning: Could not record incoming transfer " << incoming.transferId << endl;
        }
    });
    server->start();

    airlink::TcpPeerTransport transport;
    airlink::TransferCoordinator coordinator(registry, transport, resources, history);

    // Signaling is optional: without it the daemon only serves direct transfers
    unique_ptr<airlink::TcpSignalingChannel> channel;
    unique_ptr<airlink::DiscoveryService> discovery;
    string signalingHost;
    uint16_t signalingPort = 0;
    if (!signalingAddress.empty()) {
        if (!airlink::parseAddress(signalingAddress, signalingHost, signalingPort)) {
            cerr << "Invalid signaling address '" << signalingAddress << "', expected host:port" << endl;
            return 1;
        }

        airlink::PeerDescriptor self;
        self.id = localId;
        self.displayName = displayName;
        self.host = localAddressToward(signalingHost, signalingPort);
        self.port = server->port();
        self.platform = airlink::localPlatformClass();

        channel = make_unique<airlink::TcpSignalingChannel>();
        if (!channel->connect(signalingHost, signalingPort, airlink::DEFAULT_CONNECT_TIMEOUT)) {
            cerr << "Warning: Signaling relay unavailable, will keep retrying" << endl;
        }
        discovery = make_unique<airlink::DiscoveryService>(registry, *channel, self);
        discovery->start();
    }

    // No SA_RESTART: a signal interrupts the blocking command read
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    cout << "Node " << localId << " running. Type help for commands, Ctrl+C to exit." << endl;

    // Reconnect the relay from a side thread so the command loop stays responsive
    thread reconnector;
    if (channel) {
        reconnector = thread([&]() {
            auto nextAttempt = chrono::steady_clock::now() + chrono::seconds(5);
            while (g_running) {
                this_thread::sleep_for(chrono::milliseconds(200));
                if (chrono::steady_clock::now() < nextAttempt) {
                    continue;
                }
                nextAttempt = chrono::steady_clock::now() + chrono::seconds(5);
                if (!channel->isConnected() &&
                    channel->connect(signalingHost, signalingPort, airlink::DEFAULT_CONNECT_TIMEOUT)) {
                    discovery->announceNow();
                }
            }
        });
    }

    string line;
    while (g_running) {
        if (!getline(cin, line)) {
            // stdin closed (running detached): idle until a signal arrives
            cin.clear();
            while (g_running) {
                this_thread::sleep_for(chrono::seconds(1));
            }
            break;
        }
        runCommand(line, registry, coordinator, history);
    }

    cout << "Shutting down..." << endl;
    g_running = false;
    if (reconnector.joinable()) {
        reconnector.join();
    }
    if (discovery) {
        discovery->stop();
    }
    coordinator.shutdown();
    server->stop();
    return 0;
}
