#include "airlink/Message.hpp"
#include <zlib.h>      // crc32
#include <stdexcept>
#include <iostream>

namespace airlink {

    namespace {

        // ------------------------------------------------------------
        // Big-endian writers
        // ------------------------------------------------------------
        void putU8(std::vector<uint8_t>& out, uint8_t value) {
            out.push_back(value);
        }

        void putU16(std::vector<uint8_t>& out, uint16_t value) {
            out.push_back(static_cast<uint8_t>(value >> 8));
            out.push_back(static_cast<uint8_t>(value));
        }

        void putU32(std::vector<uint8_t>& out, uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void putU64(std::vector<uint8_t>& out, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void putString(std::vector<uint8_t>& out, const std::string& value) {
            putU32(out, static_cast<uint32_t>(value.size()));
            out.insert(out.end(), value.begin(), value.end());
        }

        uint32_t readU32At(const uint8_t* data) {
            return (static_cast<uint32_t>(data[0]) << 24) |
                   (static_cast<uint32_t>(data[1]) << 16) |
                   (static_cast<uint32_t>(data[2]) << 8)  |
                    static_cast<uint32_t>(data[3]);
        }

        uint64_t readU64At(const uint8_t* data) {
            uint64_t value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | data[i];
            }
            return value;
        }

        // ------------------------------------------------------------
        // Bounds-checked reader; every read fails once the buffer is short
        // ------------------------------------------------------------
        class PayloadReader {
        public:
            explicit PayloadReader(const std::vector<uint8_t>& buffer) : data(buffer) {}

            bool u8(uint8_t& out) {
                if (!has(1)) return false;
                out = data[pos++];
                return true;
            }

            bool u16(uint16_t& out) {
                if (!has(2)) return false;
                out = static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
                pos += 2;
                return true;
            }

            bool u32(uint32_t& out) {
                if (!has(4)) return false;
                out = readU32At(&data[pos]);
                pos += 4;
                return true;
            }

            bool u64(uint64_t& out) {
                if (!has(8)) return false;
                out = readU64At(&data[pos]);
                pos += 8;
                return true;
            }

            bool str(std::string& out, size_t maxLength) {
                uint32_t length = 0;
                if (!u32(length) || length > maxLength || !has(length)) return false;
                out.assign(data.begin() + pos, data.begin() + pos + length);
                pos += length;
                return true;
            }

            bool rest(std::vector<uint8_t>& out) {
                out.assign(data.begin() + pos, data.end());
                pos = data.size();
                return true;
            }

            bool done() const {
                return pos == data.size();
            }

        private:
            bool has(size_t count) const {
                return data.size() - pos >= count;
            }

            const std::vector<uint8_t>& data;
            size_t pos = 0;
        };

        bool readDescriptor(PayloadReader& reader, PeerDescriptor& out) {
            uint8_t platform = 0;
            if (!reader.str(out.id, MAX_ID_LENGTH) ||
                !reader.str(out.displayName, MAX_NAME_LENGTH) ||
                !reader.str(out.host, MAX_NAME_LENGTH) ||
                !reader.u16(out.port) ||
                !reader.u8(platform)) {
                return false;
            }
            out.platform = platformClassFromString(platformClassToString(static_cast<PlatformClass>(platform)));
            return true;
        }

        void writeDescriptor(std::vector<uint8_t>& out, const PeerDescriptor& descriptor) {
            putString(out, descriptor.id);
            putString(out, descriptor.displayName);
            putString(out, descriptor.host);
            putU16(out, descriptor.port);
            putU8(out, static_cast<uint8_t>(descriptor.platform));
        }

    } // namespace

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeMessage(const Message& message) {
        const uint64_t payloadLength = message.payload.size();

        if (payloadLength > MAX_PAYLOAD_SIZE) {
            throw std::runtime_error("Payload size exceeds maximum allowed");
        }

        std::vector<uint8_t> buffer;
        buffer.reserve(MESSAGE_HEADER_SIZE + payloadLength + CHECKSUM_SIZE);

        putU32(buffer, message.magic);
        putU8(buffer, message.version);
        putU8(buffer, static_cast<uint8_t>(message.type));
        putU64(buffer, payloadLength);

        if (!message.payload.empty()) {
            buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());
        }

        // CRC32 over everything above
        putU32(buffer, crc32_buf(buffer.data(), buffer.size()));
        return buffer;
    }

    // ------------------------------------------------------------
    // HEADER ONLY
    // ------------------------------------------------------------
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuffer, Message& outputHeader, uint64_t& payloadLength) {
        if (headerBuffer.size() < MESSAGE_HEADER_SIZE) {
            return false;
        }

        outputHeader.magic = readU32At(&headerBuffer[0]);
        outputHeader.version = headerBuffer[4];
        const uint8_t rawType = headerBuffer[5];
        payloadLength = readU64At(&headerBuffer[6]);

        if (outputHeader.magic != NETWORK_MAGIC) {
            std::cerr << "Warning: Invalid network magic in message header" << std::endl;
            return false;
        }

        if (outputHeader.version != PROTOCOL_VERSION) {
            std::cerr << "Warning: Unsupported protocol version: " << static_cast<int>(outputHeader.version) << std::endl;
            return false;
        }

        if (!isKnownMessageType(rawType)) {
            std::cerr << "Warning: Unknown message type: " << static_cast<int>(rawType) << std::endl;
            return false;
        }
        outputHeader.type = static_cast<MessageType>(rawType);

        if (payloadLength > MAX_PAYLOAD_SIZE) {
            std::cerr << "Warning: Payload size too large: " << payloadLength << std::endl;
            return false;
        }

        return true;
    }

    // ------------------------------------------------------------
    // FULL FRAME (header + payload + checksum)
    // ------------------------------------------------------------
    bool parseFullMessage(const std::vector<uint8_t>& buffer, Message& outputMessage) {
        if (buffer.size() < MESSAGE_HEADER_SIZE + CHECKSUM_SIZE) {
            return false;
        }

        Message header;
        uint64_t payloadLength = 0;
        if (!parseMessageHeader(buffer, header, payloadLength)) {
            return false;
        }

        const size_t totalLength = MESSAGE_HEADER_SIZE + payloadLength + CHECKSUM_SIZE;
        if (buffer.size() < totalLength) {
            return false; // incomplete
        }

        const uint32_t receivedChecksum = readU32At(&buffer[MESSAGE_HEADER_SIZE + payloadLength]);
        const uint32_t calculatedChecksum = crc32_buf(buffer.data(), MESSAGE_HEADER_SIZE + payloadLength);
        if (calculatedChecksum != receivedChecksum) {
            std::cerr << "Warning: Message checksum verification failed" << std::endl;
            return false;
        }

        outputMessage = header;
        outputMessage.payload.assign(
            buffer.begin() + MESSAGE_HEADER_SIZE,
            buffer.begin() + MESSAGE_HEADER_SIZE + payloadLength);

        return true;
    }

    bool isKnownMessageType(uint8_t raw) {
        switch (static_cast<MessageType>(raw)) {
            case MessageType::PING:
            case MessageType::PONG:
            case MessageType::PEER_ANNOUNCE:
            case MessageType::PEER_LIST:
            case MessageType::PEER_OFFLINE:
            case MessageType::HEARTBEAT:
            case MessageType::TRANSFER_OFFER:
            case MessageType::TRANSFER_REQUEST:
            case MessageType::TRANSFER_ACCEPT:
            case MessageType::TRANSFER_REJECT:
            case MessageType::CHUNK:
            case MessageType::CHUNK_ACK:
            case MessageType::TRANSFER_CANCEL:
                return true;
        }
        return false;
    }

    std::string messageTypeToString(MessageType type) {
        switch (type) {
            case MessageType::PING:             return "PING";
            case MessageType::PONG:             return "PONG";
            case MessageType::PEER_ANNOUNCE:    return "PEER_ANNOUNCE";
            case MessageType::PEER_LIST:        return "PEER_LIST";
            case MessageType::PEER_OFFLINE:     return "PEER_OFFLINE";
            case MessageType::HEARTBEAT:        return "HEARTBEAT";
            case MessageType::TRANSFER_OFFER:   return "TRANSFER_OFFER";
            case MessageType::TRANSFER_REQUEST: return "TRANSFER_REQUEST";
            case MessageType::TRANSFER_ACCEPT:  return "TRANSFER_ACCEPT";
            case MessageType::TRANSFER_REJECT:  return "TRANSFER_REJECT";
            case MessageType::CHUNK:            return "CHUNK";
            case MessageType::CHUNK_ACK:        return "CHUNK_ACK";
            case MessageType::TRANSFER_CANCEL:  return "TRANSFER_CANCEL";
        }
        return "UNKNOWN";
    }

    Message makeMessage(MessageType type, std::vector<uint8_t> payload) {
        Message message;
        message.type = type;
        message.payload = std::move(payload);
        return message;
    }

    // ------------------------------------------------------------
    // SIGNALING PAYLOADS
    // ------------------------------------------------------------
    std::vector<uint8_t> serializePeerDescriptor(const PeerDescriptor& descriptor) {
        std::vector<uint8_t> result;
        writeDescriptor(result, descriptor);
        return result;
    }

    std::vector<uint8_t> serializeSignalPayload(const SignalPayload& payload) {
        std::vector<uint8_t> result;
        putString(result, payload.fromId);
        putString(result, payload.toId);
        putU64(result, payload.nonce);
        putU32(result, static_cast<uint32_t>(payload.peers.size()));
        for (const auto& descriptor : payload.peers) {
            writeDescriptor(result, descriptor);
        }
        return result;
    }

    bool deserializeSignalPayload(const std::vector<uint8_t>& data, SignalPayload& out) {
        PayloadReader reader(data);
        uint32_t count = 0;

        if (!reader.str(out.fromId, MAX_ID_LENGTH) ||
            !reader.str(out.toId, MAX_ID_LENGTH) ||
            !reader.u64(out.nonce) ||
            !reader.u32(count) ||
            count > MAX_PEER_LIST) {
            return false;
        }

        out.peers.clear();
        out.peers.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            PeerDescriptor descriptor;
            if (!readDescriptor(reader, descriptor)) {
                return false;
            }
            out.peers.push_back(std::move(descriptor));
        }

        return reader.done();
    }

    // ------------------------------------------------------------
    // TRANSFER PAYLOADS
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeTransferOffer(const TransferOffer& offer) {
        std::vector<uint8_t> result;
        putString(result, offer.transferId);
        putString(result, offer.senderId);
        putString(result, offer.name);
        putU64(result, offer.totalSize);
        putString(result, offer.contentKind);
        putU32(result, offer.chunkSize);
        return result;
    }

    bool deserializeTransferOffer(const std::vector<uint8_t>& data, TransferOffer& out) {
        PayloadReader reader(data);
        return reader.str(out.transferId, MAX_ID_LENGTH) &&
               reader.str(out.senderId, MAX_ID_LENGTH) &&
               reader.str(out.name, MAX_NAME_LENGTH) &&
               reader.u64(out.totalSize) &&
               reader.str(out.contentKind, MAX_NAME_LENGTH) &&
               reader.u32(out.chunkSize) &&
               reader.done();
    }

    std::vector<uint8_t> serializeTransferRequest(const TransferRequest& request) {
        std::vector<uint8_t> result;
        putString(result, request.transferId);
        putString(result, request.requesterId);
        putString(result, request.name);
        putU32(result, request.chunkSize);
        return result;
    }

    bool deserializeTransferRequest(const std::vector<uint8_t>& data, TransferRequest& out) {
        PayloadReader reader(data);
        return reader.str(out.transferId, MAX_ID_LENGTH) &&
               reader.str(out.requesterId, MAX_ID_LENGTH) &&
               reader.str(out.name, MAX_NAME_LENGTH) &&
               reader.u32(out.chunkSize) &&
               reader.done();
    }

    std::vector<uint8_t> serializeTransferAccept(const TransferAccept& accept) {
        std::vector<uint8_t> result;
        putU64(result, accept.totalSize);
        return result;
    }

    bool deserializeTransferAccept(const std::vector<uint8_t>& data, TransferAccept& out) {
        PayloadReader reader(data);
        return reader.u64(out.totalSize) && reader.done();
    }

    std::vector<uint8_t> serializeChunk(const ChunkPayload& chunk) {
        std::vector<uint8_t> result;
        result.reserve(8 + chunk.data.size());
        putU64(result, chunk.offset);
        result.insert(result.end(), chunk.data.begin(), chunk.data.end());
        return result;
    }

    bool deserializeChunk(const std::vector<uint8_t>& data, ChunkPayload& out) {
        PayloadReader reader(data);
        return reader.u64(out.offset) && reader.rest(out.data);
    }

    std::vector<uint8_t> serializeChunkAck(const ChunkAck& ack) {
        std::vector<uint8_t> result;
        putU64(result, ack.offset);
        putU32(result, ack.length);
        return result;
    }

    bool deserializeChunkAck(const std::vector<uint8_t>& data, ChunkAck& out) {
        PayloadReader reader(data);
        return reader.u64(out.offset) && reader.u32(out.length) && reader.done();
    }

    std::vector<uint8_t> serializeReason(const std::string& reason) {
        std::vector<uint8_t> result;
        putString(result, reason.substr(0, MAX_NAME_LENGTH));
        return result;
    }

    bool deserializeReason(const std::vector<uint8_t>& data, std::string& out) {
        PayloadReader reader(data);
        return reader.str(out, MAX_NAME_LENGTH) && reader.done();
    }

    std::vector<uint8_t> serializeNonce(uint64_t nonce) {
        std::vector<uint8_t> result;
        putU64(result, nonce);
        return result;
    }

    bool deserializeNonce(const std::vector<uint8_t>& data, uint64_t& out) {
        PayloadReader reader(data);
        return reader.u64(out) && reader.done();
    }

} // namespace airlink
