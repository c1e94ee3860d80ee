#include "airlink/PeerTransport.hpp"
#include "airlink/Random.hpp"
#include <iostream>

namespace airlink {

    namespace {

        using SteadyClock = std::chrono::steady_clock;

        std::chrono::milliseconds remaining(SteadyClock::time_point deadline) {
            const auto now = SteadyClock::now();
            if (now >= deadline) {
                throw TimeoutError("Connect timed out");
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            if (left.count() == 0) {
                left = std::chrono::milliseconds(1);
            }
            return left;
        }

    } // namespace

    TcpTransferChannel::TcpTransferChannel()
        : sock(io),
          headerBuf(MESSAGE_HEADER_SIZE) {}

    TcpTransferChannel::~TcpTransferChannel() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    void TcpTransferChannel::runIo(std::chrono::milliseconds timeout) {
        io.restart();
        if (timeout.count() <= 0) {
            io.run();
            return;
        }

        io.run_for(timeout);
        if (!io.stopped()) {
            // Deadline hit with work still pending: closing the socket completes it
            boost::system::error_code ec;
            sock.close(ec);
            io.run();
            aborted.store(true);
            throw TimeoutError("Operation timed out after " + std::to_string(timeout.count()) + " ms");
        }
    }

    void TcpTransferChannel::checkUsable() const {
        if (aborted.load()) {
            throw IoError("Channel aborted");
        }
    }

    void TcpTransferChannel::connectSocket(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
        checkUsable();

        boost::system::error_code ec;
        tcp::resolver resolver(io);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            throw IoError("Resolve failed for " + host + ": " + ec.message());
        }

        boost::system::error_code result;
        boost::asio::async_connect(sock, endpoints,
            [&result](const boost::system::error_code& ec2, const tcp::endpoint&) {
                result = ec2;
            });
        runIo(timeout);

        if (result) {
            throw IoError("Connect failed: " + result.message());
        }
    }

    void TcpTransferChannel::connect(const std::string& host, uint16_t port,
                                     const ChannelRequest& request,
                                     std::chrono::milliseconds timeout) {
        const auto deadline = SteadyClock::now() + timeout;
        connectSocket(host, port, remaining(deadline));

        Message hello;
        if (request.direction == TransferDirection::OUTBOUND) {
            TransferOffer offer;
            offer.transferId = request.transferId;
            offer.senderId = request.localPeerId;
            offer.name = request.resource.name;
            offer.totalSize = request.resource.totalSizeBytes;
            offer.contentKind = request.resource.contentKind;
            offer.chunkSize = request.chunkSize;
            hello = makeMessage(MessageType::TRANSFER_OFFER, serializeTransferOffer(offer));
        } else {
            TransferRequest pull;
            pull.transferId = request.transferId;
            pull.requesterId = request.localPeerId;
            pull.name = request.resource.name;
            pull.chunkSize = request.chunkSize;
            hello = makeMessage(MessageType::TRANSFER_REQUEST, serializeTransferRequest(pull));
        }

        writeFrame(hello, remaining(deadline));
        Message reply = readFrame(remaining(deadline));

        if (reply.type == MessageType::TRANSFER_REJECT) {
            std::string reason;
            if (!deserializeReason(reply.payload, reason)) {
                reason = "no reason given";
            }
            throw IoError("Rejected by peer: " + reason);
        }

        if (reply.type != MessageType::TRANSFER_ACCEPT) {
            throw IoError("Unexpected handshake reply: " + messageTypeToString(reply.type));
        }

        TransferAccept accept;
        if (!deserializeTransferAccept(reply.payload, accept)) {
            throw IoError("Malformed accept");
        }

        if (request.resource.totalSizeBytes != 0 && accept.totalSize != request.resource.totalSizeBytes) {
            throw IoError("Size mismatch: expected " + std::to_string(request.resource.totalSizeBytes) +
                          ", peer has " + std::to_string(accept.totalSize));
        }
        remoteSize = accept.totalSize;
    }

    void TcpTransferChannel::writeFrame(const Message& msg, std::chrono::milliseconds timeout) {
        checkUsable();

        std::vector<uint8_t> buf;
        try {
            buf = serializeMessage(msg);
        } catch (const std::exception& e) {
            throw IoError(std::string("Message serialization failed: ") + e.what());
        }

        boost::system::error_code result;
        boost::asio::async_write(sock, boost::asio::buffer(buf),
            [&result](const boost::system::error_code& ec, std::size_t) {
                result = ec;
            });
        runIo(timeout);

        if (result) {
            throw IoError("Send error: " + result.message());
        }
    }

    Message TcpTransferChannel::readFrame(std::chrono::milliseconds timeout) {
        checkUsable();

        boost::system::error_code result;
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [&result](const boost::system::error_code& ec, std::size_t) {
                result = ec;
            });
        runIo(timeout);
        if (result) {
            throw IoError("Header read error: " + result.message());
        }

        Message header;
        uint64_t payloadLen = 0;
        if (!parseMessageHeader(headerBuf, header, payloadLen)) {
            throw IoError("Malformed message header");
        }

        payloadBuf.resize(static_cast<std::size_t>(payloadLen + CHECKSUM_SIZE));
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [&result](const boost::system::error_code& ec, std::size_t) {
                result = ec;
            });
        runIo(timeout);
        if (result) {
            throw IoError("Payload read error: " + result.message());
        }

        std::vector<uint8_t> full;
        full.reserve(headerBuf.size() + payloadBuf.size());
        full.insert(full.end(), headerBuf.begin(), headerBuf.end());
        full.insert(full.end(), payloadBuf.begin(), payloadBuf.end());

        Message msg;
        if (!parseFullMessage(full, msg)) {
            throw IoError("Message checksum verification failed");
        }
        return msg;
    }

    void TcpTransferChannel::sendChunk(uint64_t offset, const uint8_t* data, size_t length) {
        ChunkPayload chunk;
        chunk.offset = offset;
        chunk.data.assign(data, data + length);
        writeFrame(makeMessage(MessageType::CHUNK, serializeChunk(chunk)), std::chrono::milliseconds::zero());

        Message reply = readFrame(std::chrono::milliseconds::zero());
        if (reply.type == MessageType::TRANSFER_CANCEL) {
            throw IoError("Transfer cancelled by peer");
        }
        if (reply.type != MessageType::CHUNK_ACK) {
            throw IoError("Expected chunk ack, got " + messageTypeToString(reply.type));
        }

        ChunkAck ack;
        if (!deserializeChunkAck(reply.payload, ack) || ack.offset != offset || ack.length != length) {
            throw IoError("Chunk acknowledgement mismatch at offset " + std::to_string(offset));
        }
    }

    void TcpTransferChannel::receiveChunk(uint64_t expectedOffset, std::vector<uint8_t>& out) {
        Message msg = readFrame(std::chrono::milliseconds::zero());
        if (msg.type == MessageType::TRANSFER_CANCEL) {
            throw IoError("Transfer cancelled by peer");
        }
        if (msg.type != MessageType::CHUNK) {
            throw IoError("Expected chunk, got " + messageTypeToString(msg.type));
        }

        ChunkPayload chunk;
        if (!deserializeChunk(msg.payload, chunk)) {
            throw IoError("Malformed chunk");
        }
        if (chunk.offset != expectedOffset) {
            throw IoError("Out of order chunk: expected offset " + std::to_string(expectedOffset) +
                          ", got " + std::to_string(chunk.offset));
        }
        if (chunk.data.empty()) {
            throw IoError("Empty chunk at offset " + std::to_string(chunk.offset));
        }
        out = std::move(chunk.data);
    }

    void TcpTransferChannel::acknowledge(uint64_t offset, uint32_t length) {
        ChunkAck ack;
        ack.offset = offset;
        ack.length = length;
        writeFrame(makeMessage(MessageType::CHUNK_ACK, serializeChunkAck(ack)), std::chrono::milliseconds::zero());
    }

    void TcpTransferChannel::abort() {
        if (aborted.exchange(true)) {
            return;
        }
        // The socket belongs to the thread running io; close it there
        boost::asio::post(io, [this]() {
            boost::system::error_code ec;
            sock.close(ec);
        });
    }

    void TcpTransferChannel::cancel(const std::string& reason) {
        if (!aborted.load() && sock.is_open()) {
            try {
                writeFrame(makeMessage(MessageType::TRANSFER_CANCEL, serializeReason(reason)),
                           std::chrono::milliseconds(1000));
            } catch (const std::exception& e) {
                std::cerr << "Warning: Could not notify peer of cancel: " << e.what() << std::endl;
            }
        }
        close();
    }

    void TcpTransferChannel::close() {
        boost::system::error_code ec;
        if (sock.is_open()) {
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        }
    }

    // ============================================================
    //  TcpPeerTransport
    // ============================================================

    std::unique_ptr<TransferChannel> TcpPeerTransport::open(const PeerInfo& peer,
                                                            const ChannelRequest& request,
                                                            std::chrono::milliseconds timeout) {
        auto channel = std::make_unique<TcpTransferChannel>();
        channel->connect(peer.host, peer.port, request, timeout);
        return channel;
    }

    bool TcpPeerTransport::probe(const PeerInfo& peer, std::chrono::milliseconds timeout) {
        const auto deadline = SteadyClock::now() + timeout;
        const uint64_t nonce = Random::nonce();

        try {
            TcpTransferChannel channel;
            channel.connectSocket(peer.host, peer.port, remaining(deadline));
            channel.writeFrame(makeMessage(MessageType::PING, serializeNonce(nonce)), remaining(deadline));

            Message reply = channel.readFrame(remaining(deadline));
            uint64_t echoed = 0;
            if (reply.type != MessageType::PONG || !deserializeNonce(reply.payload, echoed) || echoed != nonce) {
                std::cerr << "Warning: Bad probe reply from " << peer.address() << std::endl;
                return false;
            }
            channel.close();
            return true;
        } catch (const TimeoutError&) {
            std::cerr << "Info: Probe to " << peer.address() << " timed out" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Info: Probe to " << peer.address() << " failed: " << e.what() << std::endl;
        }
        return false;
    }

} // namespace airlink
