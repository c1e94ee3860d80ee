#include "airlink/TransferServer.hpp"
#include "airlink/Types.hpp"
#include <algorithm>
#include <iostream>

namespace airlink {

    // ============================================================
    //  SESSION
    // ============================================================

    /**
     * Protocol state for one accepted connection. Every method runs on the server's
     * io thread, so the session needs no locking.
     */
    class TransferSession : public std::enable_shared_from_this<TransferSession> {
    public:
        TransferSession(TransferServer& owner, FrameConnection::Ptr connection)
            : server(owner), conn(std::move(connection)) {}

        void start() {
            auto self = shared_from_this();
            conn->setMessageHandler([self](const Message& msg) {
                self->onMessage(msg);
            });
            conn->setCloseHandler([self](const std::string& reason) {
                self->onClosed(reason);
            });
            conn->start();
        }

    private:
        enum class Phase {
            IDLE,
            RECEIVING,
            SENDING,
            SETTLING,  // final ack queued, commit waits for it to be written
            DONE
        };

        void onMessage(const Message& msg) {
            if (msg.type == MessageType::TRANSFER_CANCEL && inProgress()) {
                std::string reason;
                if (!deserializeReason(msg.payload, reason)) {
                    reason = "cancelled";
                }
                abandon("Cancelled by peer: " + reason, false);
                return;
            }

            switch (phase) {
                case Phase::IDLE:
                    onIdleMessage(msg);
                    break;
                case Phase::RECEIVING:
                    onChunk(msg);
                    break;
                case Phase::SENDING:
                    onChunkAck(msg);
                    break;
                case Phase::SETTLING:
                    abandon("Unexpected " + messageTypeToString(msg.type) + " before final acknowledgement", true);
                    break;
                case Phase::DONE:
                    std::cerr << "Warning: Unexpected " << messageTypeToString(msg.type)
                              << " after transfer end from " << conn->remoteAddress() << std::endl;
                    conn->close();
                    break;
            }
        }

        void onIdleMessage(const Message& msg) {
            switch (msg.type) {
                case MessageType::PING: {
                    uint64_t nonce = 0;
                    if (!deserializeNonce(msg.payload, nonce)) {
                        std::cerr << "Warning: Malformed ping from " << conn->remoteAddress() << std::endl;
                        conn->close();
                        return;
                    }
                    conn->sendMessage(makeMessage(MessageType::PONG, serializeNonce(nonce)));
                    break;
                }
                case MessageType::TRANSFER_OFFER:
                    onOffer(msg);
                    break;
                case MessageType::TRANSFER_REQUEST:
                    onRequest(msg);
                    break;
                default:
                    std::cerr << "Warning: Unexpected " << messageTypeToString(msg.type)
                              << " from " << conn->remoteAddress() << ", closing session" << std::endl;
                    conn->close();
                    break;
            }
        }

        void onOffer(const Message& msg) {
            TransferOffer offer;
            if (!deserializeTransferOffer(msg.payload, offer) || offer.totalSize == 0 || offer.name.empty()) {
                reject("Malformed offer");
                return;
            }

            info.transferId = offer.transferId;
            info.peerId = offer.senderId;
            info.direction = TransferDirection::INBOUND;

            std::string reason;
            if (!server.admit(offer, reason)) {
                reject(reason.empty() ? "Declined" : reason);
                return;
            }

            ResourceDescriptor descriptor;
            descriptor.name = offer.name;
            descriptor.totalSizeBytes = offer.totalSize;
            if (!offer.contentKind.empty()) {
                descriptor.contentKind = offer.contentKind;
            }

            std::string error;
            if (!server.resources.resolve(descriptor, TransferDirection::INBOUND, error)) {
                reject(error);
                return;
            }

            try {
                sink = server.resources.openSink(descriptor);
            } catch (const IoError& e) {
                reject(e.what());
                return;
            }

            info.resource = descriptor;
            phase = Phase::RECEIVING;

            TransferAccept accept;
            accept.totalSize = descriptor.totalSizeBytes;
            conn->sendMessage(makeMessage(MessageType::TRANSFER_ACCEPT, serializeTransferAccept(accept)));

            std::cout << "Info: Receiving '" << descriptor.name << "' (" << descriptor.totalSizeBytes
                      << " bytes) from " << offer.senderId << std::endl;
        }

        void onRequest(const Message& msg) {
            TransferRequest request;
            if (!deserializeTransferRequest(msg.payload, request) || request.name.empty()) {
                reject("Malformed request");
                return;
            }

            info.transferId = request.transferId;
            info.peerId = request.requesterId;
            info.direction = TransferDirection::OUTBOUND;

            ResourceDescriptor descriptor;
            if (!server.resources.lookupShared(request.name, descriptor)) {
                reject("Not shared: " + request.name);
                return;
            }

            try {
                source = server.resources.openSource(descriptor);
            } catch (const IoError& e) {
                reject(e.what());
                return;
            }

            chunkSize = request.chunkSize;
            if (chunkSize == 0 || chunkSize > MAX_CHUNK_SIZE) {
                chunkSize = chunkSizeFor(descriptor.totalSizeBytes);
            }
            buffer.resize(chunkSize);

            info.resource = descriptor;
            phase = Phase::SENDING;

            TransferAccept accept;
            accept.totalSize = descriptor.totalSizeBytes;
            conn->sendMessage(makeMessage(MessageType::TRANSFER_ACCEPT, serializeTransferAccept(accept)));

            std::cout << "Info: Serving '" << descriptor.name << "' to " << request.requesterId << std::endl;
            sendNextChunk();
        }

        void onChunk(const Message& msg) {
            if (msg.type != MessageType::CHUNK) {
                abandon("Expected chunk, got " + messageTypeToString(msg.type), true);
                return;
            }

            ChunkPayload chunk;
            if (!deserializeChunk(msg.payload, chunk)) {
                abandon("Malformed chunk", true);
                return;
            }

            const uint64_t total = info.resource.totalSizeBytes;
            if (chunk.offset != info.bytesTransferred || chunk.data.empty() ||
                chunk.data.size() > total - info.bytesTransferred) {
                abandon("Chunk out of sequence at offset " + std::to_string(chunk.offset), true);
                return;
            }

            try {
                sink->write(chunk.data.data(), chunk.data.size());
            } catch (const IoError& e) {
                abandon(e.what(), true);
                return;
            }

            info.bytesTransferred += chunk.data.size();

            ChunkAck ack;
            ack.offset = chunk.offset;
            ack.length = static_cast<uint32_t>(chunk.data.size());
            const Message ackMsg = makeMessage(MessageType::CHUNK_ACK, serializeChunkAck(ack));

            if (info.bytesTransferred < total) {
                conn->sendMessage(ackMsg);
                return;
            }

            // The file only becomes visible once the sender can know it arrived
            phase = Phase::SETTLING;
            auto self = shared_from_this();
            conn->sendMessage(ackMsg, [self]() {
                self->settle();
            });
        }

        void settle() {
            if (phase != Phase::SETTLING) {
                return;
            }
            try {
                sink->commit();
            } catch (const IoError& e) {
                abandon(e.what(), true);
                return;
            }
            succeed();
        }

        void onChunkAck(const Message& msg) {
            if (msg.type != MessageType::CHUNK_ACK) {
                abandon("Expected chunk ack, got " + messageTypeToString(msg.type), true);
                return;
            }

            ChunkAck ack;
            if (!deserializeChunkAck(msg.payload, ack) || ack.offset != info.bytesTransferred || ack.length != inFlight) {
                abandon("Chunk acknowledgement mismatch", true);
                return;
            }

            info.bytesTransferred += inFlight;
            inFlight = 0;

            if (info.bytesTransferred == info.resource.totalSizeBytes) {
                succeed();
                return;
            }
            sendNextChunk();
        }

        void sendNextChunk() {
            const uint64_t left = info.resource.totalSizeBytes - info.bytesTransferred;
            const size_t want = static_cast<size_t>(std::min<uint64_t>(chunkSize, left));

            size_t got = 0;
            try {
                got = source->read(buffer.data(), want);
            } catch (const IoError& e) {
                abandon(e.what(), true);
                return;
            }

            if (got == 0) {
                abandon("Shared file shrank while serving", true);
                return;
            }

            ChunkPayload chunk;
            chunk.offset = info.bytesTransferred;
            chunk.data.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(got));
            inFlight = static_cast<uint32_t>(got);
            conn->sendMessage(makeMessage(MessageType::CHUNK, serializeChunk(chunk)));
        }

        void reject(const std::string& reason) {
            std::cerr << "Warning: Rejecting transfer from " << conn->remoteAddress() << ": " << reason << std::endl;
            conn->sendMessage(makeMessage(MessageType::TRANSFER_REJECT, serializeReason(reason)));
            phase = Phase::DONE;
            conn->close();
        }

        void succeed() {
            phase = Phase::DONE;
            info.success = true;
            sink.reset();
            source.reset();
            std::cout << "Info: Transfer " << info.transferId << " finished ("
                      << info.bytesTransferred << " bytes)" << std::endl;
            server.reportCompletion(info);
        }

        void abandon(const std::string& error, bool notifyPeer) {
            if (phase == Phase::DONE) {
                return;
            }
            phase = Phase::DONE;

            std::cerr << "Error: Transfer " << info.transferId << " aborted: " << error << std::endl;
            if (sink) {
                sink->discard();
                sink.reset();
            }
            source.reset();

            if (notifyPeer) {
                conn->sendMessage(makeMessage(MessageType::TRANSFER_CANCEL, serializeReason(error)));
            }
            conn->close();

            info.success = false;
            info.error = error;
            server.reportCompletion(info);
        }

        bool inProgress() const {
            return phase == Phase::RECEIVING || phase == Phase::SENDING || phase == Phase::SETTLING;
        }

        void onClosed(const std::string& reason) {
            if (inProgress()) {
                abandon(reason.empty() ? "Peer closed the connection" : reason, false);
            }
            server.onSessionClosed(conn);
        }

        TransferServer& server;
        FrameConnection::Ptr conn;
        Phase phase = Phase::IDLE;
        IncomingTransfer info;
        std::unique_ptr<ChunkSink> sink;
        std::unique_ptr<ChunkSource> source;
        std::vector<uint8_t> buffer;
        uint32_t chunkSize = 0;
        uint32_t inFlight = 0;
    };

    // ============================================================
    //  SERVER
    // ============================================================

    TransferServer::TransferServer(ResourceProvider& resourceProvider, uint16_t listenPort)
        : resources(resourceProvider),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          acceptor(io, tcp::endpoint(tcp::v4(), listenPort)) {}

    TransferServer::~TransferServer() {
        stop();
    }

    void TransferServer::start() {
        if (running.exchange(true)) {
            return;
        }

        doAccept();

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "TransferServer IO context error: " << e.what() << std::endl;
            }
        });

        std::cout << "Info: Transfer server listening on port " << port() << std::endl;
    }

    void TransferServer::stop() {
        if (!running.exchange(false)) {
            return;
        }

        boost::asio::post(io, [this]() {
            boost::system::error_code ec;
            acceptor.close(ec);

            std::set<FrameConnection::Ptr> open;
            {
                std::lock_guard<std::mutex> lock(sessionMtx);
                open = sessions;
            }
            for (const auto& conn : open) {
                conn->close("Server stopping");
            }
        });
        workGuard.reset();

        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    uint16_t TransferServer::port() const {
        boost::system::error_code ec;
        auto endpoint = acceptor.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    size_t TransferServer::activeSessions() const {
        std::lock_guard<std::mutex> lock(sessionMtx);
        return sessions.size();
    }

    void TransferServer::setIncomingPolicy(IncomingPolicy policy) {
        std::lock_guard<std::mutex> lock(callbackMtx);
        incomingPolicy = std::move(policy);
    }

    void TransferServer::setCompletionHandler(CompletionCallback cb) {
        std::lock_guard<std::mutex> lock(callbackMtx);
        onComplete = std::move(cb);
    }

    void TransferServer::doAccept() {
        auto conn = std::make_shared<FrameConnection>(io);
        acceptor.async_accept(conn->socket(),
            [this, conn](const boost::system::error_code& ec) {
                if (!ec) {
                    {
                        std::lock_guard<std::mutex> lock(sessionMtx);
                        sessions.insert(conn);
                    }
                    std::make_shared<TransferSession>(*this, conn)->start();
                } else if (ec != boost::asio::error::operation_aborted) {
                    std::cerr << "Accept error: " << ec.message() << std::endl;
                }

                if (running.load() && acceptor.is_open()) {
                    doAccept();
                }
            });
    }

    void TransferServer::onSessionClosed(const FrameConnection::Ptr& conn) {
        std::lock_guard<std::mutex> lock(sessionMtx);
        sessions.erase(conn);
    }

    bool TransferServer::admit(const TransferOffer& offer, std::string& reason) {
        IncomingPolicy policy;
        {
            std::lock_guard<std::mutex> lock(callbackMtx);
            policy = incomingPolicy;
        }

        if (!policy) {
            return true;
        }

        try {
            return policy(offer, reason);
        } catch (const std::exception& e) {
            reason = std::string("Policy error: ") + e.what();
            return false;
        }
    }

    void TransferServer::reportCompletion(const IncomingTransfer& transfer) {
        CompletionCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMtx);
            cb = onComplete;
        }

        if (cb) {
            try {
                cb(transfer);
            } catch (const std::exception& e) {
                std::cerr << "Error in completion handler: " << e.what() << std::endl;
            }
        }
    }

} // namespace airlink
