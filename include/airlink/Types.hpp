#ifndef AIRLINK_TYPES_HPP
#define AIRLINK_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace airlink {

    // ============================================================
    //  PROTOCOL CONFIGURATION
    // ============================================================

    // Network magic value, unique to airlink frames
    inline constexpr uint32_t NETWORK_MAGIC = 0xA1F7D0C5;

    // Protocol version
    inline constexpr uint8_t PROTOCOL_VERSION = 1;

    // Size limits
    inline constexpr size_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024; // 4 MB max
    inline constexpr size_t MESSAGE_HEADER_SIZE = 4 + 1 + 1 + 8; // magic + version + type + payload_len
    inline constexpr size_t CHECKSUM_SIZE = 4; // CRC32

    // Identifiers
    inline constexpr size_t TRANSFER_ID_BYTES = 16; // 128-bit, hex encoded
    inline constexpr size_t PEER_ID_BYTES = 16;
    inline constexpr size_t MAX_ID_LENGTH = 128;
    inline constexpr size_t MAX_NAME_LENGTH = 255;
    inline constexpr size_t MAX_PEER_LIST = 1024;

    inline constexpr uint16_t DEFAULT_TRANSFER_PORT = 8080;

    // ============================================================
    //  LIVENESS WINDOWS
    // ============================================================

    inline constexpr std::chrono::seconds DEFAULT_HEARTBEAT_WINDOW{30};
    inline constexpr std::chrono::seconds DEFAULT_PRUNE_WINDOW{120};

    inline constexpr std::chrono::seconds DEFAULT_ANNOUNCE_PERIOD{5};
    inline constexpr std::chrono::seconds DEFAULT_HEARTBEAT_PERIOD{10};
    inline constexpr std::chrono::seconds DEFAULT_PRUNE_PERIOD{30};

    // ============================================================
    //  TRANSFER LIMITS
    // ============================================================

    inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};
    inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{5000};
    inline constexpr size_t DEFAULT_MAX_CONCURRENT_TRANSFERS = 4;
    inline constexpr size_t DEFAULT_PROBE_THREADS = 2;
    inline constexpr size_t MAX_HISTORY_ENTRIES = 100;

    // Chunk size bands, keyed on the total resource size
    inline constexpr uint64_t SMALL_FILE_LIMIT = 1ULL * 1024 * 1024;    // < 1 MiB
    inline constexpr uint64_t MEDIUM_FILE_LIMIT = 10ULL * 1024 * 1024;  // < 10 MiB
    inline constexpr uint64_t LARGE_FILE_LIMIT = 100ULL * 1024 * 1024;  // < 100 MiB

    inline constexpr size_t SMALL_CHUNK_SIZE = 16 * 1024;
    inline constexpr size_t MEDIUM_CHUNK_SIZE = 64 * 1024;
    inline constexpr size_t LARGE_CHUNK_SIZE = 256 * 1024;
    inline constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024;

} // namespace airlink

#endif // AIRLINK_TYPES_HPP
