#include "airlink/DiscoveryService.hpp"
#include <iostream>

namespace airlink {

    DiscoveryService::DiscoveryService(PeerRegistry& peerRegistry,
                                       SignalingChannel& signalingChannel,
                                       PeerDescriptor self,
                                       DiscoveryConfig config)
        : registry(peerRegistry),
          channel(signalingChannel),
          local(std::move(self)),
          cfg(config),
          io(),
          announceTimer(io),
          heartbeatTimer(io),
          pruneTimer(io) {}

    DiscoveryService::~DiscoveryService() {
        stop();
    }

    void DiscoveryService::start() {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        if (running.load()) {
            return;
        }

        channel.setHandler([this](const SignalingEvent& event) {
            handleEvent(event);
        });

        io.restart();
        running.store(true);
        scheduleAnnounce();
        scheduleHeartbeat();
        schedulePrune();

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "DiscoveryService IO context error: " << e.what() << std::endl;
            }
        });

        std::cout << "Info: Discovery started as " << local.displayName << " (" << local.id << ")" << std::endl;
        announceNow();
    }

    void DiscoveryService::stop() {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        if (!running.exchange(false)) {
            return;
        }

        boost::asio::post(io, [this]() {
            announceTimer.cancel();
            heartbeatTimer.cancel();
            pruneTimer.cancel();
        });

        if (ioThread.joinable()) {
            ioThread.join();
        }
        // Drain anything posted after the loop ran dry so a later start() begins clean
        io.restart();
        io.run();

        channel.setHandler(nullptr);
        sendEvent(SignalingEventType::OFFLINE);
        std::cout << "Info: Discovery stopped" << std::endl;
    }

    void DiscoveryService::handleEvent(const SignalingEvent& event) {
        if (event.fromId.empty()) {
            std::cerr << "Warning: Dropping " << signalingEventTypeToString(event.type)
                      << " without sender id" << std::endl;
            return;
        }

        // Our own broadcasts echoed back by the relay, or traffic meant for someone else
        if (event.fromId == local.id || (!event.toId.empty() && event.toId != local.id)) {
            return;
        }

        switch (event.type) {
            case SignalingEventType::ANNOUNCE: {
                if (event.peers.empty()) {
                    std::cerr << "Warning: Announce from " << event.fromId << " carries no descriptor" << std::endl;
                    return;
                }
                for (const auto& peer : event.peers) {
                    // A peer only speaks for itself, relayed lists come as PEER_LIST
                    if (peer.id != event.fromId) {
                        std::cerr << "Warning: Announce from " << event.fromId
                                  << " describes another peer " << peer.id << ", ignored" << std::endl;
                        continue;
                    }
                    const bool known = registry.contains(peer.id);
                    if (registry.upsertFromAnnounce(peer) && !known) {
                        // Newcomer: answer directly so it does not wait a full announce period
                        sendEvent(SignalingEventType::ANNOUNCE, event.fromId);
                    }
                }
                break;
            }
            case SignalingEventType::PEER_LIST:
                for (const auto& peer : event.peers) {
                    registry.upsertFromAnnounce(peer);
                }
                break;
            case SignalingEventType::OFFLINE:
                registry.markOffline(event.fromId);
                break;
            case SignalingEventType::HEARTBEAT:
                registry.recordHeartbeat(event.fromId);
                break;
            case SignalingEventType::PING:
                sendEvent(SignalingEventType::PONG, event.fromId, event.nonce);
                break;
            case SignalingEventType::PONG:
                registry.recordPong(event.fromId);
                break;
        }
    }

    bool DiscoveryService::announceNow() {
        return sendEvent(SignalingEventType::ANNOUNCE);
    }

    bool DiscoveryService::heartbeatNow() {
        return sendEvent(SignalingEventType::HEARTBEAT);
    }

    size_t DiscoveryService::pruneNow() {
        return registry.prune(Clock::now());
    }

    bool DiscoveryService::sendEvent(SignalingEventType type, const std::string& toId, uint64_t nonce) {
        SignalingEvent event;
        event.type = type;
        event.fromId = local.id;
        event.toId = toId;
        event.nonce = nonce;
        if (type == SignalingEventType::ANNOUNCE) {
            event.peers.push_back(local);
        }
        return channel.send(event);
    }

    void DiscoveryService::scheduleAnnounce() {
        announceTimer.expires_after(cfg.announceInterval);
        announceTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                announceNow();
                scheduleAnnounce();
            }
        });
    }

    void DiscoveryService::scheduleHeartbeat() {
        heartbeatTimer.expires_after(cfg.heartbeatInterval);
        heartbeatTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                heartbeatNow();
                scheduleHeartbeat();
            }
        });
    }

    void DiscoveryService::schedulePrune() {
        pruneTimer.expires_after(cfg.pruneInterval);
        pruneTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                pruneNow();
                schedulePrune();
            }
        });
    }

} // namespace airlink
