#include "airlink/PeerRegistry.hpp"
#include <algorithm>
#include <iostream>

namespace airlink {

    PeerRegistry::PeerRegistry(std::string localPeerId, RegistryConfig config)
        : localId(std::move(localPeerId)),
          cfg(config) {}

    bool PeerRegistry::upsertFromAnnounce(const PeerDescriptor& descriptor) {
        return upsertFromAnnounce(descriptor, Clock::now());
    }

    bool PeerRegistry::upsertFromAnnounce(const PeerDescriptor& descriptor, TimePoint now) {
        if (!descriptor.isValid()) {
            std::cerr << "Warning: Rejecting malformed announce (id='" << descriptor.id
                      << "', address=" << descriptor.address() << ")" << std::endl;
            return false;
        }

        if (descriptor.id == localId) {
            return false; // own announce echoed back
        }

        PeerEvent event;
        {
            std::lock_guard<std::mutex> lock(mtx);

            PeerInfo info;
            info.id = descriptor.id;
            info.displayName = descriptor.displayName;
            info.host = descriptor.host;
            info.port = descriptor.port;
            info.platform = descriptor.platform;
            info.lastSeen = now;
            info.liveness = classifyLiveness(now, now, cfg.heartbeatWindow, cfg.pruneWindow);

            auto it = peers.find(descriptor.id);
            if (it != peers.end()) {
                it->second.info = info;
                event.type = PeerEventType::UPDATED;
            } else {
                Entry entry;
                entry.info = info;
                entry.sequence = nextSequence++;
                peers.emplace(descriptor.id, std::move(entry));
                event.type = PeerEventType::ADDED;
            }
            event.peer = info;
        }

        notify({event});
        return true;
    }

    bool PeerRegistry::markOffline(const std::string& peerId) {
        PeerEvent event;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = peers.find(peerId);
            if (it == peers.end()) {
                return false;
            }

            event.type = PeerEventType::REMOVED;
            event.peer = it->second.info;
            event.peer.liveness = Liveness::OFFLINE;
            peers.erase(it);
        }

        notify({event});
        return true;
    }

    bool PeerRegistry::recordHeartbeat(const std::string& peerId) {
        return refresh(peerId, Clock::now());
    }

    bool PeerRegistry::recordHeartbeat(const std::string& peerId, TimePoint now) {
        return refresh(peerId, now);
    }

    bool PeerRegistry::recordPong(const std::string& peerId) {
        return refresh(peerId, Clock::now());
    }

    bool PeerRegistry::recordPong(const std::string& peerId, TimePoint now) {
        return refresh(peerId, now);
    }

    bool PeerRegistry::refresh(const std::string& peerId, TimePoint now) {
        PeerEvent event;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = peers.find(peerId);
            if (it == peers.end()) {
                return false;
            }

            PeerInfo& info = it->second.info;
            const Liveness previous = info.liveness;
            if (now > info.lastSeen) {
                info.lastSeen = now;
            }
            info.liveness = classifyLiveness(info.lastSeen, now, cfg.heartbeatWindow, cfg.pruneWindow);

            changed = previous != info.liveness;
            event.type = PeerEventType::UPDATED;
            event.peer = info;
        }

        // Plain refreshes are not worth an event unless liveness moved
        if (changed) {
            notify({event});
        }
        return true;
    }

    size_t PeerRegistry::prune(TimePoint now) {
        std::vector<PeerEvent> removed;
        {
            std::lock_guard<std::mutex> lock(mtx);

            auto it = peers.begin();
            while (it != peers.end()) {
                const auto age = now - it->second.info.lastSeen;
                if (age >= cfg.pruneWindow) {
                    PeerEvent event;
                    event.type = PeerEventType::REMOVED;
                    event.peer = it->second.info;
                    event.peer.liveness = Liveness::OFFLINE;
                    removed.push_back(std::move(event));
                    it = peers.erase(it);
                } else {
                    it->second.info.liveness = classifyLiveness(
                        it->second.info.lastSeen, now, cfg.heartbeatWindow, cfg.pruneWindow);
                    ++it;
                }
            }
        }

        if (!removed.empty()) {
            std::cout << "Info: Pruned " << removed.size() << " stale peer(s)" << std::endl;
            notify(removed);
        }
        return removed.size();
    }

    std::vector<PeerInfo> PeerRegistry::snapshot() const {
        return snapshot(Clock::now());
    }

    std::vector<PeerInfo> PeerRegistry::snapshot(TimePoint now) const {
        std::vector<std::pair<uint64_t, PeerInfo>> ordered;
        {
            std::lock_guard<std::mutex> lock(mtx);
            ordered.reserve(peers.size());
            for (const auto& [id, entry] : peers) {
                ordered.emplace_back(entry.sequence, entry.info);
            }
        }

        std::sort(ordered.begin(), ordered.end(),
                  [](const auto& first, const auto& second) { return first.first < second.first; });

        std::vector<PeerInfo> result;
        result.reserve(ordered.size());
        for (auto& [sequence, info] : ordered) {
            info.liveness = classifyLiveness(info.lastSeen, now, cfg.heartbeatWindow, cfg.pruneWindow);
            result.push_back(std::move(info));
        }
        return result;
    }

    std::optional<PeerInfo> PeerRegistry::find(const std::string& peerId) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(peerId);
        if (it == peers.end()) {
            return std::nullopt;
        }

        PeerInfo info = it->second.info;
        info.liveness = classifyLiveness(info.lastSeen, Clock::now(), cfg.heartbeatWindow, cfg.pruneWindow);
        return info;
    }

    bool PeerRegistry::contains(const std::string& peerId) const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.find(peerId) != peers.end();
    }

    size_t PeerRegistry::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.size();
    }

    void PeerRegistry::clear() {
        std::vector<PeerEvent> removed;
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (const auto& [id, entry] : peers) {
                PeerEvent event;
                event.type = PeerEventType::REMOVED;
                event.peer = entry.info;
                removed.push_back(std::move(event));
            }
            peers.clear();
        }
        notify(removed);
    }

    const std::string& PeerRegistry::localPeerId() const {
        return localId;
    }

    const RegistryConfig& PeerRegistry::config() const {
        return cfg;
    }

    PeerRegistry::ListenerId PeerRegistry::subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(listenerMtx);
        const ListenerId id = nextListenerId++;
        listeners.emplace_back(id, std::move(listener));
        return id;
    }

    void PeerRegistry::unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lock(listenerMtx);
        listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                       [id](const auto& entry) { return entry.first == id; }),
                        listeners.end());
    }

    void PeerRegistry::notify(const std::vector<PeerEvent>& events) const {
        if (events.empty()) {
            return;
        }

        std::vector<Listener> current;
        {
            std::lock_guard<std::mutex> lock(listenerMtx);
            current.reserve(listeners.size());
            for (const auto& entry : listeners) {
                current.push_back(entry.second);
            }
        }

        for (const auto& event : events) {
            for (const auto& listener : current) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    std::cerr << "Error in peer listener: " << e.what() << std::endl;
                }
            }
        }
    }

} // namespace airlink
