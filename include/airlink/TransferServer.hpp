#ifndef AIRLINK_TRANSFER_SERVER_HPP
#define AIRLINK_TRANSFER_SERVER_HPP

#include "FrameConnection.hpp"
#include "ResourceIO.hpp"
#include "Message.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace airlink {

    /** Outcome of a session served by the TransferServer. */
    struct IncomingTransfer {
        std::string transferId;
        std::string peerId;
        std::string remoteAddress;
        TransferDirection direction = TransferDirection::INBOUND; // INBOUND = pushed to us
        ResourceDescriptor resource;
        uint64_t bytesTransferred = 0;
        bool success = false;
        std::string error;
    };

    /**
     * Accepts transfer sessions from remote coordinators: answers probes, receives
     * pushed resources into the provider and serves pulls from its shared files.
     */
    class TransferServer {
        public:
            // Return false and fill reason to reject an offer
            using IncomingPolicy = std::function<bool(const TransferOffer&, std::string& reason)>;
            using CompletionCallback = std::function<void(const IncomingTransfer&)>;

            /**
             * Binds the acceptor immediately; throws boost::system::system_error when the
             * port is taken. Port 0 picks an ephemeral port, see port().
             */
            TransferServer(ResourceProvider& resources, uint16_t listenPort);
            ~TransferServer();

            TransferServer(const TransferServer&) = delete;
            TransferServer& operator=(const TransferServer&) = delete;

            void start();
            void stop();

            uint16_t port() const;
            bool isRunning() const { return running.load(); }
            size_t activeSessions() const;

            void setIncomingPolicy(IncomingPolicy policy);
            void setCompletionHandler(CompletionCallback cb);

        private:
            friend class TransferSession;

            void doAccept();
            void onSessionClosed(const FrameConnection::Ptr& conn);
            bool admit(const TransferOffer& offer, std::string& reason);
            void reportCompletion(const IncomingTransfer& transfer);

            ResourceProvider& resources;
            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            tcp::acceptor acceptor;

            mutable std::mutex sessionMtx;
            std::set<FrameConnection::Ptr> sessions;

            mutable std::mutex callbackMtx;
            IncomingPolicy incomingPolicy;
            CompletionCallback onComplete;

            std::thread ioThread;
            std::atomic<bool> running{false};
    };

} // namespace airlink

#endif // AIRLINK_TRANSFER_SERVER_HPP
