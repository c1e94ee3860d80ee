#ifndef AIRLINK_DISCOVERY_SERVICE_HPP
#define AIRLINK_DISCOVERY_SERVICE_HPP

#include "PeerRegistry.hpp"
#include "SignalingChannel.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace airlink {

    struct DiscoveryConfig {
        std::chrono::milliseconds announceInterval = DEFAULT_ANNOUNCE_PERIOD;
        std::chrono::milliseconds heartbeatInterval = DEFAULT_HEARTBEAT_PERIOD;
        std::chrono::milliseconds pruneInterval = DEFAULT_PRUNE_PERIOD;
    };

    /**
     * Feeds the registry from a signaling channel and keeps the local peer visible:
     * periodic announce and heartbeat, periodic prune, pong on ping.
     */
    class DiscoveryService {
        public:
            DiscoveryService(PeerRegistry& registry,
                             SignalingChannel& channel,
                             PeerDescriptor self,
                             DiscoveryConfig config = DiscoveryConfig());
            ~DiscoveryService();

            DiscoveryService(const DiscoveryService&) = delete;
            DiscoveryService& operator=(const DiscoveryService&) = delete;

            void start();
            /** Stops the timers and broadcasts an offline event. */
            void stop();
            bool isRunning() const { return running.load(); }

            /** Applies one inbound event to the registry. */
            void handleEvent(const SignalingEvent& event);

            bool announceNow();
            bool heartbeatNow();
            size_t pruneNow();

            const PeerDescriptor& self() const { return local; }

        private:
            void scheduleAnnounce();
            void scheduleHeartbeat();
            void schedulePrune();
            bool sendEvent(SignalingEventType type, const std::string& toId = "", uint64_t nonce = 0);

            PeerRegistry& registry;
            SignalingChannel& channel;
            PeerDescriptor local;
            DiscoveryConfig cfg;

            boost::asio::io_context io;
            boost::asio::steady_timer announceTimer;
            boost::asio::steady_timer heartbeatTimer;
            boost::asio::steady_timer pruneTimer;
            std::thread ioThread;
            std::mutex lifecycleMtx;
            std::atomic<bool> running{false};
    };

} // namespace airlink

#endif // AIRLINK_DISCOVERY_SERVICE_HPP
