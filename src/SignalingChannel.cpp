#include "airlink/SignalingChannel.hpp"
#include <future>
#include <iostream>

namespace airlink {

    namespace {

        MessageType wireTypeOf(SignalingEventType type) {
            switch (type) {
                case SignalingEventType::ANNOUNCE:  return MessageType::PEER_ANNOUNCE;
                case SignalingEventType::PEER_LIST: return MessageType::PEER_LIST;
                case SignalingEventType::OFFLINE:   return MessageType::PEER_OFFLINE;
                case SignalingEventType::HEARTBEAT: return MessageType::HEARTBEAT;
                case SignalingEventType::PING:      return MessageType::PING;
                case SignalingEventType::PONG:      return MessageType::PONG;
            }
            return MessageType::HEARTBEAT;
        }

    } // namespace

    std::string signalingEventTypeToString(SignalingEventType type) {
        switch (type) {
            case SignalingEventType::ANNOUNCE:  return "announce";
            case SignalingEventType::PEER_LIST: return "peer-list";
            case SignalingEventType::OFFLINE:   return "offline";
            case SignalingEventType::HEARTBEAT: return "heartbeat";
            case SignalingEventType::PING:      return "ping";
            case SignalingEventType::PONG:      return "pong";
        }
        return "unknown";
    }

    Message toMessage(const SignalingEvent& event) {
        SignalPayload payload;
        payload.fromId = event.fromId;
        payload.toId = event.toId;
        payload.nonce = event.nonce;
        payload.peers = event.peers;
        return makeMessage(wireTypeOf(event.type), serializeSignalPayload(payload));
    }

    bool fromMessage(const Message& msg, SignalingEvent& out) {
        SignalingEvent event;
        switch (msg.type) {
            case MessageType::PEER_ANNOUNCE: event.type = SignalingEventType::ANNOUNCE;  break;
            case MessageType::PEER_LIST:     event.type = SignalingEventType::PEER_LIST; break;
            case MessageType::PEER_OFFLINE:  event.type = SignalingEventType::OFFLINE;   break;
            case MessageType::HEARTBEAT:     event.type = SignalingEventType::HEARTBEAT; break;
            case MessageType::PING:          event.type = SignalingEventType::PING;      break;
            case MessageType::PONG:          event.type = SignalingEventType::PONG;      break;
            default:
                return false;
        }

        SignalPayload payload;
        if (!deserializeSignalPayload(msg.payload, payload)) {
            return false;
        }

        event.fromId = std::move(payload.fromId);
        event.toId = std::move(payload.toId);
        event.nonce = payload.nonce;
        event.peers = std::move(payload.peers);
        out = std::move(event);
        return true;
    }

    // ============================================================
    //  TcpSignalingChannel
    // ============================================================

    TcpSignalingChannel::TcpSignalingChannel()
        : io(),
          workGuard(boost::asio::make_work_guard(io)) {
        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "Signaling IO context error: " << e.what() << std::endl;
            }
        });
    }

    TcpSignalingChannel::~TcpSignalingChannel() {
        {
            std::lock_guard<std::mutex> lock(handlerMtx);
            onEvent = nullptr;
            onDisconnect = nullptr;
        }
        disconnect();
        workGuard.reset();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    bool TcpSignalingChannel::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
        disconnect();

        boost::system::error_code ec;
        tcp::resolver resolver(io);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            std::cerr << "Error: Cannot resolve signaling host " << host << ": " << ec.message() << std::endl;
            return false;
        }

        auto connection = std::make_shared<FrameConnection>(io);
        auto done = std::make_shared<std::promise<boost::system::error_code>>();
        auto result = done->get_future();

        boost::asio::async_connect(connection->socket(), endpoints,
            [done](const boost::system::error_code& ec2, const tcp::endpoint&) {
                done->set_value(ec2);
            });

        if (result.wait_for(timeout) != std::future_status::ready) {
            boost::asio::post(io, [connection]() {
                boost::system::error_code closeError;
                connection->socket().close(closeError);
            });
            std::cerr << "Error: Signaling connect to " << host << ":" << port << " timed out" << std::endl;
            return false;
        }

        const auto connectError = result.get();
        if (connectError) {
            std::cerr << "Error: Signaling connect failed: " << connectError.message() << std::endl;
            return false;
        }

        connection->setMessageHandler([this](const Message& msg) {
            dispatch(msg);
        });
        std::weak_ptr<FrameConnection> weak = connection;
        connection->setCloseHandler([this, weak](const std::string& reason) {
            onConnectionClosed(weak.lock(), reason);
        });

        {
            std::lock_guard<std::mutex> lock(connMtx);
            conn = connection;
        }
        boost::asio::post(io, [connection]() { connection->start(); });

        std::cout << "Info: Connected to signaling relay " << host << ":" << port << std::endl;
        return true;
    }

    void TcpSignalingChannel::disconnect() {
        FrameConnection::Ptr current;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            current = std::move(conn);
            conn.reset();
        }
        if (current) {
            current->close("Disconnected locally");
        }
    }

    bool TcpSignalingChannel::isConnected() const {
        std::lock_guard<std::mutex> lock(connMtx);
        return conn != nullptr;
    }

    bool TcpSignalingChannel::send(const SignalingEvent& event) {
        FrameConnection::Ptr current;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            current = conn;
        }

        if (!current) {
            std::cerr << "Warning: Signaling not connected, dropping "
                      << signalingEventTypeToString(event.type) << std::endl;
            return false;
        }

        current->sendMessage(toMessage(event));
        return true;
    }

    void TcpSignalingChannel::setHandler(EventHandler handler) {
        std::lock_guard<std::mutex> lock(handlerMtx);
        onEvent = std::move(handler);
    }

    void TcpSignalingChannel::setDisconnectHandler(DisconnectHandler handler) {
        std::lock_guard<std::mutex> lock(handlerMtx);
        onDisconnect = std::move(handler);
    }

    void TcpSignalingChannel::dispatch(const Message& msg) {
        SignalingEvent event;
        if (!fromMessage(msg, event)) {
            std::cerr << "Warning: Dropping malformed signaling frame ("
                      << messageTypeToString(msg.type) << ")" << std::endl;
            return;
        }

        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMtx);
            handler = onEvent;
        }
        if (handler) {
            handler(event);
        }
    }

    void TcpSignalingChannel::onConnectionClosed(const FrameConnection::Ptr& closed, const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(connMtx);
            if (closed && conn == closed) {
                conn.reset();
            }
        }

        DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMtx);
            handler = onDisconnect;
        }

        std::cerr << "Warning: Signaling connection closed"
                  << (reason.empty() ? "" : ": " + reason) << std::endl;
        if (handler) {
            handler(reason);
        }
    }

} // namespace airlink
