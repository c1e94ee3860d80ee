#ifndef AIRLINK_PEER_REGISTRY_HPP
#define AIRLINK_PEER_REGISTRY_HPP

#include "Peer.hpp"
#include "Types.hpp"
#include <unordered_map>
#include <mutex>
#include <vector>
#include <string>
#include <functional>
#include <optional>
#include <chrono>
#include <cstdint>

namespace airlink {

    struct RegistryConfig {
        std::chrono::milliseconds heartbeatWindow = DEFAULT_HEARTBEAT_WINDOW;
        std::chrono::milliseconds pruneWindow = DEFAULT_PRUNE_WINDOW;
    };

    enum class PeerEventType : uint8_t {
        ADDED,
        UPDATED,
        REMOVED
    };

    struct PeerEvent {
        PeerEventType type = PeerEventType::ADDED;
        PeerInfo peer;
    };

    class PeerRegistry {
        public:
            using Listener = std::function<void(const PeerEvent&)>;
            using ListenerId = uint64_t;

            explicit PeerRegistry(std::string localPeerId, RegistryConfig config = RegistryConfig());
            ~PeerRegistry() = default;

            PeerRegistry(const PeerRegistry&) = delete;
            PeerRegistry& operator=(const PeerRegistry&) = delete;

            /**
             * Inserts or replaces the record for descriptor.id. Malformed descriptors and the
             * local identity are rejected without touching the registry.
             */
            bool upsertFromAnnounce(const PeerDescriptor& descriptor);
            bool upsertFromAnnounce(const PeerDescriptor& descriptor, TimePoint now);

            /**
             * Forces a peer offline and removes it right away.
             */
            bool markOffline(const std::string& peerId);

            /**
             * Refreshes lastSeen only. Unknown peers are ignored.
             */
            bool recordHeartbeat(const std::string& peerId);
            bool recordHeartbeat(const std::string& peerId, TimePoint now);
            bool recordPong(const std::string& peerId);
            bool recordPong(const std::string& peerId, TimePoint now);

            /**
             * Removes every peer not seen for at least the prune window.
             */
            size_t prune(TimePoint now);

            /**
             * Point-in-time copy in first-seen order.
             */
            std::vector<PeerInfo> snapshot() const;
            std::vector<PeerInfo> snapshot(TimePoint now) const;

            std::optional<PeerInfo> find(const std::string& peerId) const;
            bool contains(const std::string& peerId) const;
            size_t size() const;
            void clear();

            const std::string& localPeerId() const;
            const RegistryConfig& config() const;

            ListenerId subscribe(Listener listener);
            void unsubscribe(ListenerId id);

        private:
            struct Entry {
                PeerInfo info;
                uint64_t sequence = 0; // first-seen order
            };

            bool refresh(const std::string& peerId, TimePoint now);
            void notify(const std::vector<PeerEvent>& events) const;

            const std::string localId;
            const RegistryConfig cfg;

            mutable std::mutex mtx;
            std::unordered_map<std::string, Entry> peers; // key = peer id
            uint64_t nextSequence = 0;

            mutable std::mutex listenerMtx;
            std::vector<std::pair<ListenerId, Listener>> listeners;
            ListenerId nextListenerId = 1;
    };

} // namespace airlink

#endif // AIRLINK_PEER_REGISTRY_HPP
