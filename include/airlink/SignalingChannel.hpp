#ifndef AIRLINK_SIGNALING_CHANNEL_HPP
#define AIRLINK_SIGNALING_CHANNEL_HPP

#include "FrameConnection.hpp"
#include "Message.hpp"
#include "Peer.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace airlink {

    enum class SignalingEventType : uint8_t {
        ANNOUNCE,
        PEER_LIST,
        OFFLINE,
        HEARTBEAT,
        PING,
        PONG
    };

    struct SignalingEvent {
        SignalingEventType type = SignalingEventType::ANNOUNCE;
        std::string fromId;
        std::string toId;                  // empty = broadcast
        std::vector<PeerDescriptor> peers; // announce / peer-list
        uint64_t nonce = 0;                // ping / pong
    };

    std::string signalingEventTypeToString(SignalingEventType type);

    // Codec between signaling events and wire frames
    Message toMessage(const SignalingEvent& event);
    bool fromMessage(const Message& msg, SignalingEvent& out);

    /**
     * Delivers discovery events, at most once per underlying connection. Reconnecting is
     * up to the owner of the channel.
     */
    class SignalingChannel {
    public:
        using EventHandler = std::function<void(const SignalingEvent&)>;
        using DisconnectHandler = std::function<void(const std::string&)>;

        virtual ~SignalingChannel() = default;

        /** Returns false when the event was dropped (not connected). */
        virtual bool send(const SignalingEvent& event) = 0;
        virtual void setHandler(EventHandler handler) = 0;
        virtual void setDisconnectHandler(DisconnectHandler handler) = 0;
    };

    /** Speaks the framed protocol to a signaling relay over TCP. */
    class TcpSignalingChannel : public SignalingChannel {
    public:
        TcpSignalingChannel();
        ~TcpSignalingChannel() override;

        TcpSignalingChannel(const TcpSignalingChannel&) = delete;
        TcpSignalingChannel& operator=(const TcpSignalingChannel&) = delete;

        bool connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
        void disconnect();
        bool isConnected() const;

        bool send(const SignalingEvent& event) override;
        void setHandler(EventHandler handler) override;
        void setDisconnectHandler(DisconnectHandler handler) override;

    private:
        void dispatch(const Message& msg);
        void onConnectionClosed(const FrameConnection::Ptr& closed, const std::string& reason);

        boost::asio::io_context io;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
        std::thread ioThread;

        mutable std::mutex connMtx;
        FrameConnection::Ptr conn;

        mutable std::mutex handlerMtx;
        EventHandler onEvent;
        DisconnectHandler onDisconnect;
    };

} // namespace airlink

#endif // AIRLINK_SIGNALING_CHANNEL_HPP
