#include "airlink/Transfer.hpp"
#include "airlink/Types.hpp"

namespace airlink {

    double TransferRecord::progressRatio() const {
        if (resource.totalSizeBytes == 0) {
            return 0.0;
        }
        return static_cast<double>(bytesTransferred) / static_cast<double>(resource.totalSizeBytes);
    }

    bool TransferRecord::isTerminal() const {
        return isTerminalState(state);
    }

    double TransferRecord::durationSeconds() const {
        if (!isTerminal() || endedAt < startedAt) {
            return 0.0;
        }
        return std::chrono::duration<double>(endedAt - startedAt).count();
    }

    bool isLegalTransition(TransferState from, TransferState to) {
        switch (from) {
            case TransferState::PENDING:
                return to == TransferState::CONNECTING || to == TransferState::FAILED;
            case TransferState::CONNECTING:
                return to == TransferState::ACTIVE ||
                       to == TransferState::FAILED ||
                       to == TransferState::CANCELLED;
            case TransferState::ACTIVE:
                return to == TransferState::PAUSED ||
                       to == TransferState::COMPLETED ||
                       to == TransferState::FAILED ||
                       to == TransferState::CANCELLED;
            case TransferState::PAUSED:
                return to == TransferState::ACTIVE || to == TransferState::CANCELLED;
            case TransferState::FAILED:
                return to == TransferState::PENDING;
            case TransferState::COMPLETED:
            case TransferState::CANCELLED:
                return false;
        }
        return false;
    }

    bool isTerminalState(TransferState state) {
        return state == TransferState::COMPLETED ||
               state == TransferState::FAILED ||
               state == TransferState::CANCELLED;
    }

    uint32_t chunkSizeFor(uint64_t totalSizeBytes) {
        if (totalSizeBytes < SMALL_FILE_LIMIT) {
            return SMALL_CHUNK_SIZE;
        }
        if (totalSizeBytes < MEDIUM_FILE_LIMIT) {
            return MEDIUM_CHUNK_SIZE;
        }
        if (totalSizeBytes < LARGE_FILE_LIMIT) {
            return LARGE_CHUNK_SIZE;
        }
        return MAX_CHUNK_SIZE;
    }

    std::string transferStateToString(TransferState state) {
        switch (state) {
            case TransferState::PENDING:    return "pending";
            case TransferState::CONNECTING: return "connecting";
            case TransferState::ACTIVE:     return "active";
            case TransferState::PAUSED:     return "paused";
            case TransferState::COMPLETED:  return "completed";
            case TransferState::FAILED:     return "failed";
            case TransferState::CANCELLED:  return "cancelled";
        }
        return "unknown";
    }

    TransferState transferStateFromString(const std::string& name) {
        if (name == "connecting") return TransferState::CONNECTING;
        if (name == "active")     return TransferState::ACTIVE;
        if (name == "paused")     return TransferState::PAUSED;
        if (name == "completed")  return TransferState::COMPLETED;
        if (name == "failed")     return TransferState::FAILED;
        if (name == "cancelled")  return TransferState::CANCELLED;
        return TransferState::PENDING;
    }

    std::string transferDirectionToString(TransferDirection direction) {
        return direction == TransferDirection::OUTBOUND ? "outbound" : "inbound";
    }

    TransferDirection transferDirectionFromString(const std::string& name) {
        return name == "inbound" ? TransferDirection::INBOUND : TransferDirection::OUTBOUND;
    }

    std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NONE:       return "none";
            case ErrorKind::VALIDATION: return "validation";
            case ErrorKind::TIMEOUT:    return "timeout";
            case ErrorKind::IO:         return "io";
        }
        return "none";
    }

    ErrorKind errorKindFromString(const std::string& name) {
        if (name == "validation") return ErrorKind::VALIDATION;
        if (name == "timeout")    return ErrorKind::TIMEOUT;
        if (name == "io")         return ErrorKind::IO;
        return ErrorKind::NONE;
    }

    std::string opStatusToString(OpStatus status) {
        switch (status) {
            case OpStatus::OK:               return "ok";
            case OpStatus::NOT_FOUND:        return "transfer not found";
            case OpStatus::NOT_APPLICABLE:   return "not applicable in current state";
            case OpStatus::UNKNOWN_PEER:     return "unknown peer";
            case OpStatus::INVALID_RESOURCE: return "invalid resource";
        }
        return "unknown";
    }

} // namespace airlink
