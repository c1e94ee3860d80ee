#ifndef AIRLINK_PEER_TRANSPORT_HPP
#define AIRLINK_PEER_TRANSPORT_HPP

#include "Message.hpp"
#include "Transfer.hpp"
#include "Peer.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace airlink {

    using tcp = boost::asio::ip::tcp;

    /** What the local side asks of the remote side when a transfer session opens. */
    struct ChannelRequest {
        TransferDirection direction = TransferDirection::OUTBOUND;
        std::string transferId;
        std::string localPeerId;
        ResourceDescriptor resource;
        uint32_t chunkSize = 0;
    };

    /**
     * One open transfer session with a remote peer. Every blocking call throws IoError
     * when the peer drops, rejects, or the channel was aborted.
     */
    class TransferChannel {
    public:
        virtual ~TransferChannel() = default;

        /** Size the remote side agreed on in its accept. */
        virtual uint64_t acceptedSize() const = 0;

        /** Sends one chunk and blocks until the remote side acknowledges it. */
        virtual void sendChunk(uint64_t offset, const uint8_t* data, size_t length) = 0;

        /** Blocks until the next chunk arrives; it must start at expectedOffset. */
        virtual void receiveChunk(uint64_t expectedOffset, std::vector<uint8_t>& out) = 0;
        virtual void acknowledge(uint64_t offset, uint32_t length) = 0;

        /** Thread safe. Interrupts a blocked call; the channel is unusable afterwards. */
        virtual void abort() = 0;

        /** Tells the remote side the transfer is abandoned, then closes. Never throws. */
        virtual void cancel(const std::string& reason) = 0;
        virtual void close() = 0;
    };

    class PeerTransport {
    public:
        virtual ~PeerTransport() = default;

        /**
         * Connects and completes the offer or request handshake within timeout.
         * Throws TimeoutError when the deadline passes and IoError on any other failure.
         */
        virtual std::unique_ptr<TransferChannel> open(const PeerInfo& peer,
                                                      const ChannelRequest& request,
                                                      std::chrono::milliseconds timeout) = 0;

        /** PING / PONG round trip. False on timeout or any error. */
        virtual bool probe(const PeerInfo& peer, std::chrono::milliseconds timeout) = 0;
    };

    // ============================================================
    //  TCP
    // ============================================================

    class TcpTransferChannel : public TransferChannel {
    public:
        TcpTransferChannel();
        ~TcpTransferChannel() override;

        TcpTransferChannel(const TcpTransferChannel&) = delete;
        TcpTransferChannel& operator=(const TcpTransferChannel&) = delete;

        void connectSocket(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

        /**
         * Resolves and connects to host:port, sends the offer or request and waits for
         * the answer. The whole sequence shares one deadline.
         */
        void connect(const std::string& host, uint16_t port,
                     const ChannelRequest& request,
                     std::chrono::milliseconds timeout);

        uint64_t acceptedSize() const override { return remoteSize; }

        void sendChunk(uint64_t offset, const uint8_t* data, size_t length) override;
        void receiveChunk(uint64_t expectedOffset, std::vector<uint8_t>& out) override;
        void acknowledge(uint64_t offset, uint32_t length) override;

        void abort() override;
        void cancel(const std::string& reason) override;
        void close() override;

        // Frame level helpers, also used by the probe. A zero timeout waits forever.
        void writeFrame(const Message& msg, std::chrono::milliseconds timeout);
        Message readFrame(std::chrono::milliseconds timeout);

    private:
        void runIo(std::chrono::milliseconds timeout);
        void checkUsable() const;

        boost::asio::io_context io;
        tcp::socket sock;
        std::vector<uint8_t> headerBuf;
        std::vector<uint8_t> payloadBuf;
        uint64_t remoteSize = 0;
        std::atomic<bool> aborted{false};
    };

    class TcpPeerTransport : public PeerTransport {
    public:
        TcpPeerTransport() = default;

        std::unique_ptr<TransferChannel> open(const PeerInfo& peer,
                                              const ChannelRequest& request,
                                              std::chrono::milliseconds timeout) override;

        bool probe(const PeerInfo& peer, std::chrono::milliseconds timeout) override;
    };

} // namespace airlink

#endif // AIRLINK_PEER_TRANSPORT_HPP
