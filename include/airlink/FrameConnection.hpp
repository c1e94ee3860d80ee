#ifndef AIRLINK_FRAME_CONNECTION_HPP
#define AIRLINK_FRAME_CONNECTION_HPP

#include "Message.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace airlink {

    using tcp = boost::asio::ip::tcp;

    /**
     * Asynchronous framed connection. Reads run as a loop on the owning io_context;
     * sends may come from any thread and are queued so frames never interleave.
     */
    class FrameConnection : public std::enable_shared_from_this<FrameConnection> {
    public:
        using Ptr = std::shared_ptr<FrameConnection>;
        using MessageCallback = std::function<void(const Message&)>;
        using CloseCallback = std::function<void(const std::string&)>;

        /**
         * @param ctx The io_context every handler of this connection runs on.
         */
        explicit FrameConnection(boost::asio::io_context& ctx);

        /**
         * Closes the socket if it is still open.
         */
        ~FrameConnection();

        tcp::socket& socket();

        /**
         * Starts the read loop. Call once the socket is connected or accepted.
         */
        void start();

        using WriteCallback = std::function<void()>;

        /**
         * Serializes the message and queues it for sending. Safe from any thread.
         * onWritten runs on the io thread once the frame is fully written; it is
         * dropped if the connection goes down first.
         */
        void sendMessage(const Message& msg, WriteCallback onWritten = nullptr);

        /**
         * Closes once every queued frame has been written. Safe from any thread.
         */
        void close(const std::string& reason = "");

        void setMessageHandler(MessageCallback cb);

        /**
         * The close handler runs exactly once, after which both handlers are dropped.
         */
        void setCloseHandler(CloseCallback cb);

        bool isConnected() const;
        const std::string& remoteAddress() const { return remote; }

    private:
        void asyncReadHeader();
        void asyncReadPayload(uint64_t payloadLen);
        void doWrite();
        void handleDisconnect(const std::string& reason);

        boost::asio::io_context& io;
        tcp::socket sock;
        std::string remote;
        MessageCallback onMessage;
        CloseCallback onClose;

        std::vector<uint8_t> headerBuf;
        std::vector<uint8_t> payloadBuf;
        struct PendingWrite {
            std::vector<uint8_t> frame;
            WriteCallback onWritten;
        };
        std::deque<PendingWrite> writeQueue;
        bool closing = false;
        std::string closeReason;
        std::atomic<bool> connected{false};
    };

} // namespace airlink

#endif // AIRLINK_FRAME_CONNECTION_HPP
