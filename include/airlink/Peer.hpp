#ifndef AIRLINK_PEER_HPP
#define AIRLINK_PEER_HPP

#include <string>
#include <chrono>
#include <cstdint>

namespace airlink {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // Informational only, never changes protocol behaviour
    enum class PlatformClass : uint8_t {
        ANDROID = 0,
        IOS     = 1,
        WINDOWS = 2,
        MACOS   = 3,
        LINUX   = 4,
        UNKNOWN = 255
    };

    enum class Liveness : uint8_t {
        ONLINE,
        STALE,
        OFFLINE
    };

    /** What a peer announces about itself. */
    struct PeerDescriptor {
        std::string id;
        std::string displayName;
        std::string host;
        uint16_t port = 0;
        PlatformClass platform = PlatformClass::UNKNOWN;

        /** True when every required field is present and within limits. */
        bool isValid() const;

        std::string address() const {
            return host + ":" + std::to_string(port);
        }
    };

    struct PeerInfo {
        std::string id;
        std::string displayName;
        std::string host;   // ip or hostname
        uint16_t port = 0;
        PlatformClass platform = PlatformClass::UNKNOWN;
        TimePoint lastSeen = Clock::now();
        Liveness liveness = Liveness::ONLINE;

        std::string address() const {
            return host + ":" + std::to_string(port);
        }

        PeerDescriptor descriptor() const {
            return PeerDescriptor{id, displayName, host, port, platform};
        }
    };

    std::string platformClassToString(PlatformClass platform);
    PlatformClass platformClassFromString(const std::string& name);
    PlatformClass localPlatformClass();

    std::string livenessToString(Liveness liveness);

    /** Classifies a peer from the time elapsed since it was last seen. */
    Liveness classifyLiveness(TimePoint lastSeen, TimePoint now,
                              std::chrono::milliseconds heartbeatWindow,
                              std::chrono::milliseconds pruneWindow);

    /** Splits "host:port"; returns false on a missing or out of range port. */
    bool parseAddress(const std::string& address, std::string& host, uint16_t& port);

} // namespace airlink

#endif // AIRLINK_PEER_HPP
