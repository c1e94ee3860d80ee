#include "airlink/Peer.hpp"
#include "airlink/Types.hpp"
#include <stdexcept>

namespace airlink {

    bool PeerDescriptor::isValid() const {
        if (id.empty() || id.size() > MAX_ID_LENGTH) {
            return false;
        }
        if (displayName.empty() || displayName.size() > MAX_NAME_LENGTH) {
            return false;
        }
        return !host.empty() && port > 0;
    }

    std::string platformClassToString(PlatformClass platform) {
        switch (platform) {
            case PlatformClass::ANDROID: return "android";
            case PlatformClass::IOS:     return "ios";
            case PlatformClass::WINDOWS: return "windows";
            case PlatformClass::MACOS:   return "macos";
            case PlatformClass::LINUX:   return "linux";
            default:                     return "unknown";
        }
    }

    PlatformClass platformClassFromString(const std::string& name) {
        if (name == "android") return PlatformClass::ANDROID;
        if (name == "ios")     return PlatformClass::IOS;
        if (name == "windows") return PlatformClass::WINDOWS;
        if (name == "macos")   return PlatformClass::MACOS;
        if (name == "linux")   return PlatformClass::LINUX;
        return PlatformClass::UNKNOWN;
    }

    PlatformClass localPlatformClass() {
#if defined(__ANDROID__)
        return PlatformClass::ANDROID;
#elif defined(__APPLE__)
        return PlatformClass::MACOS;
#elif defined(_WIN32)
        return PlatformClass::WINDOWS;
#elif defined(__linux__)
        return PlatformClass::LINUX;
#else
        return PlatformClass::UNKNOWN;
#endif
    }

    std::string livenessToString(Liveness liveness) {
        switch (liveness) {
            case Liveness::ONLINE:  return "online";
            case Liveness::STALE:   return "stale";
            case Liveness::OFFLINE: return "offline";
        }
        return "offline";
    }

    Liveness classifyLiveness(TimePoint lastSeen, TimePoint now,
                              std::chrono::milliseconds heartbeatWindow,
                              std::chrono::milliseconds pruneWindow) {
        // A clock step backwards counts as "just seen"
        auto age = now > lastSeen ? now - lastSeen : Clock::duration::zero();

        if (age < heartbeatWindow) {
            return Liveness::ONLINE;
        }
        if (age < pruneWindow) {
            return Liveness::STALE;
        }
        return Liveness::OFFLINE;
    }

    bool parseAddress(const std::string& address, std::string& host, uint16_t& port) {
        const size_t colon = address.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
            return false;
        }

        unsigned long value = 0;
        try {
            size_t consumed = 0;
            value = std::stoul(address.substr(colon + 1), &consumed);
            if (consumed != address.size() - colon - 1) {
                return false;
            }
        } catch (const std::exception&) {
            return false;
        }

        if (value == 0 || value > 65535) {
            return false;
        }

        host = address.substr(0, colon);
        port = static_cast<uint16_t>(value);
        return true;
    }

} // namespace airlink
