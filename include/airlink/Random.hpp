#ifndef AIRLINK_RANDOM_HPP
#define AIRLINK_RANDOM_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace airlink {

class Random {
public:
    // Initialization (once at startup)
    static bool initialize();

    // Random bytes from libsodium
    static bool randomBytes(std::vector<uint8_t>& buffer);
    static bool randomBytes(uint8_t* buffer, size_t size);
    static uint64_t randomU64();

    static std::string hexEncode(const std::vector<uint8_t>& data);

    // Identifiers
    static std::string transferId();
    static std::string peerId();
    static uint64_t nonce();
};

} // namespace airlink

#endif // AIRLINK_RANDOM_HPP
