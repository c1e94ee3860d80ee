#ifndef AIRLINK_TRANSFER_HPP
#define AIRLINK_TRANSFER_HPP

#include "Peer.hpp"
#include <string>
#include <cstdint>
#include <stdexcept>

namespace airlink {

    enum class TransferState : uint8_t {
        PENDING,
        CONNECTING,
        ACTIVE,
        PAUSED,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    enum class TransferDirection : uint8_t {
        OUTBOUND,
        INBOUND
    };

    // Timeouts are kept apart from I/O errors so retry policies can tell them apart
    enum class ErrorKind : uint8_t {
        NONE,
        VALIDATION,
        TIMEOUT,
        IO
    };

    enum class OpStatus : uint8_t {
        OK,
        NOT_FOUND,
        NOT_APPLICABLE,   // operation not legal in the current state
        UNKNOWN_PEER,
        INVALID_RESOURCE
    };

    struct ResourceDescriptor {
        std::string name;
        std::string path;          // local handle, resolved by the ResourceProvider
        uint64_t totalSizeBytes = 0;
        std::string contentKind = "application/octet-stream";
    };

    struct TransferRecord {
        std::string id;
        TransferDirection direction = TransferDirection::OUTBOUND;
        std::string fromPeerId;
        std::string toPeerId;
        std::string peerId;        // the remote counterpart
        ResourceDescriptor resource;
        TransferState state = TransferState::PENDING;
        uint64_t bytesTransferred = 0;
        uint32_t chunkSize = 0;
        TimePoint startedAt = Clock::now();
        TimePoint endedAt{};       // only meaningful in a terminal state
        std::string lastError;
        ErrorKind errorKind = ErrorKind::NONE;

        double progressRatio() const;
        bool isTerminal() const;
        /** Seconds between start and end, 0 while still running. */
        double durationSeconds() const;
    };

    struct ProgressSnapshot {
        TransferState state = TransferState::PENDING;
        uint64_t bytesTransferred = 0;
        uint64_t totalSizeBytes = 0;
        double progressRatio = 0.0;
        double instantaneousRate = 0.0; // bytes per second over the last chunk
        std::string lastError;
        ErrorKind errorKind = ErrorKind::NONE;
    };

    struct TransferStats {
        size_t total = 0;
        size_t completed = 0;
        size_t failed = 0;
        size_t cancelled = 0;
        uint64_t completedBytes = 0;
        double successRate = 0.0;
        double averageSpeed = 0.0; // bytes per second over completed transfers
    };

    // ============================================================
    //  ERRORS
    // ============================================================

    /** Chunk read/write failure, peer drop, rejected handshake. */
    class IoError : public std::runtime_error {
    public:
        explicit IoError(const std::string& what) : std::runtime_error(what) {}
    };

    /** Connect or probe deadline exceeded. */
    class TimeoutError : public std::runtime_error {
    public:
        explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
    };

    // ============================================================
    //  STATE MACHINE
    // ============================================================

    /** True when from -> to is one of the legal transitions. */
    bool isLegalTransition(TransferState from, TransferState to);
    bool isTerminalState(TransferState state);

    /** Monotonic step function: larger resources get larger chunks. */
    uint32_t chunkSizeFor(uint64_t totalSizeBytes);

    std::string transferStateToString(TransferState state);
    TransferState transferStateFromString(const std::string& name);
    std::string transferDirectionToString(TransferDirection direction);
    TransferDirection transferDirectionFromString(const std::string& name);
    std::string errorKindToString(ErrorKind kind);
    ErrorKind errorKindFromString(const std::string& name);
    std::string opStatusToString(OpStatus status);

} // namespace airlink

#endif // AIRLINK_TRANSFER_HPP
