#ifndef AIRLINK_MESSAGE_HPP
#define AIRLINK_MESSAGE_HPP

#include "Types.hpp"
#include "Peer.hpp"
#include <cstdint>
#include <vector>
#include <string>

namespace airlink {

    // ============================================================
    //  MESSAGE TYPES
    // ============================================================
    enum class MessageType : uint8_t {
        PING             = 1,
        PONG             = 2,
        PEER_ANNOUNCE    = 3,
        PEER_LIST        = 4,
        PEER_OFFLINE     = 5,
        HEARTBEAT        = 6,
        TRANSFER_OFFER   = 10,
        TRANSFER_REQUEST = 11,
        TRANSFER_ACCEPT  = 12,
        TRANSFER_REJECT  = 13,
        CHUNK            = 14,
        CHUNK_ACK        = 15,
        TRANSFER_CANCEL  = 16
    };

    // ============================================================
    //  FRAME
    // ============================================================
    struct Message {
        uint32_t magic   = NETWORK_MAGIC;
        uint8_t  version = PROTOCOL_VERSION;
        MessageType type = MessageType::PING;
        std::vector<uint8_t> payload; // binary data
    };

    // ============================================================
    //  PAYLOADS
    // ============================================================

    /** Signaling payload: announce / peer-list carry peers, ping / pong carry a nonce. */
    struct SignalPayload {
        std::string fromId;
        std::string toId;   // empty = broadcast
        uint64_t nonce = 0;
        std::vector<PeerDescriptor> peers;
    };

    /** Sender pushes a resource to the receiver. */
    struct TransferOffer {
        std::string transferId;
        std::string senderId;
        std::string name;
        uint64_t totalSize = 0;
        std::string contentKind;
        uint32_t chunkSize = 0;
    };

    /** Requester pulls a named resource from the remote side. */
    struct TransferRequest {
        std::string transferId;
        std::string requesterId;
        std::string name;
        uint32_t chunkSize = 0;
    };

    struct TransferAccept {
        uint64_t totalSize = 0;
    };

    struct ChunkPayload {
        uint64_t offset = 0;
        std::vector<uint8_t> data;
    };

    struct ChunkAck {
        uint64_t offset = 0;
        uint32_t length = 0;
    };

    // ============================================================
    //  FRAMING
    // ============================================================

    /** Serializes a Message to network bytes:
     * [magic(4) big-endian] [version(1)] [type(1)] [payload_len(8) big-endian]
     * [payload] [crc32(4) big-endian]
     * Throws std::runtime_error when the payload exceeds MAX_PAYLOAD_SIZE.
     */
    std::vector<uint8_t> serializeMessage(const Message& msg);

    /** Parses ONLY the header. Returns false on short input or an invalid field. */
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuf, Message& outHeader, uint64_t& payloadLen);

    /** Parses a complete frame (header + payload + checksum). */
    bool parseFullMessage(const std::vector<uint8_t>& buf, Message& outMsg);

    uint32_t crc32_buf(const void* data, size_t len);

    bool isKnownMessageType(uint8_t raw);
    std::string messageTypeToString(MessageType t);

    // ============================================================
    //  PAYLOAD CODECS
    // ============================================================

    std::vector<uint8_t> serializePeerDescriptor(const PeerDescriptor& descriptor);
    std::vector<uint8_t> serializeSignalPayload(const SignalPayload& payload);
    bool deserializeSignalPayload(const std::vector<uint8_t>& data, SignalPayload& out);

    std::vector<uint8_t> serializeTransferOffer(const TransferOffer& offer);
    bool deserializeTransferOffer(const std::vector<uint8_t>& data, TransferOffer& out);

    std::vector<uint8_t> serializeTransferRequest(const TransferRequest& request);
    bool deserializeTransferRequest(const std::vector<uint8_t>& data, TransferRequest& out);

    std::vector<uint8_t> serializeTransferAccept(const TransferAccept& accept);
    bool deserializeTransferAccept(const std::vector<uint8_t>& data, TransferAccept& out);

    std::vector<uint8_t> serializeChunk(const ChunkPayload& chunk);
    bool deserializeChunk(const std::vector<uint8_t>& data, ChunkPayload& out);

    std::vector<uint8_t> serializeChunkAck(const ChunkAck& ack);
    bool deserializeChunkAck(const std::vector<uint8_t>& data, ChunkAck& out);

    /** Reject / cancel reasons and ping nonces. */
    std::vector<uint8_t> serializeReason(const std::string& reason);
    bool deserializeReason(const std::vector<uint8_t>& data, std::string& out);
    std::vector<uint8_t> serializeNonce(uint64_t nonce);
    bool deserializeNonce(const std::vector<uint8_t>& data, uint64_t& out);

    /** Convenience: frame a payload of the given type. */
    Message makeMessage(MessageType type, std::vector<uint8_t> payload = {});

} // namespace airlink

#endif // AIRLINK_MESSAGE_HPP
