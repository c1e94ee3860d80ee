#include "airlink/FrameConnection.hpp"
#include <iostream>

namespace airlink {

    FrameConnection::FrameConnection(boost::asio::io_context& ctx)
        : io(ctx),
          sock(ctx),
          headerBuf(MESSAGE_HEADER_SIZE) {}

    FrameConnection::~FrameConnection() {
        boost::system::error_code ec;
        sock.close(ec);
        connected.store(false);
    }

    tcp::socket& FrameConnection::socket() {
        return sock;
    }

    void FrameConnection::setMessageHandler(MessageCallback cb) {
        onMessage = std::move(cb);
    }

    void FrameConnection::setCloseHandler(CloseCallback cb) {
        onClose = std::move(cb);
    }

    bool FrameConnection::isConnected() const {
        return connected.load() && sock.is_open();
    }

    void FrameConnection::start() {
        boost::system::error_code ec;
        auto endpoint = sock.remote_endpoint(ec);
        if (!ec) {
            remote = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

        connected.store(true);
        asyncReadHeader();
    }

    void FrameConnection::asyncReadHeader() {
        if (!isConnected()) {
            return;
        }

        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                if (ec) {
                    handleDisconnect(ec == boost::asio::error::eof ? "" : "Header read error: " + ec.message());
                    return;
                }

                if (bytes_transferred != MESSAGE_HEADER_SIZE) {
                    handleDisconnect("Incomplete header received");
                    return;
                }

                Message header;
                uint64_t payloadLen = 0;
                if (!parseMessageHeader(headerBuf, header, payloadLen)) {
                    handleDisconnect("Malformed message header");
                    return;
                }

                asyncReadPayload(payloadLen);
            });
    }

    void FrameConnection::asyncReadPayload(uint64_t payloadLen) {
        if (!isConnected()) {
            return;
        }

        // payload + checksum(4)
        payloadBuf.resize(static_cast<std::size_t>(payloadLen + CHECKSUM_SIZE));

        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    handleDisconnect("Payload read error: " + ec.message());
                    return;
                }

                std::vector<uint8_t> full;
                full.reserve(headerBuf.size() + payloadBuf.size());
                full.insert(full.end(), headerBuf.begin(), headerBuf.end());
                full.insert(full.end(), payloadBuf.begin(), payloadBuf.end());

                Message msg;
                if (!parseFullMessage(full, msg)) {
                    handleDisconnect("Message checksum verification failed");
                    return;
                }

                if (onMessage) {
                    try {
                        onMessage(msg);
                    } catch (const std::exception& e) {
                        std::cerr << "Error in message handler: " << e.what() << std::endl;
                    }
                }

                if (isConnected()) {
                    asyncReadHeader();
                }
            });
    }

    void FrameConnection::sendMessage(const Message& msg, WriteCallback onWritten) {
        std::vector<uint8_t> buf;
        try {
            buf = serializeMessage(msg);
        } catch (const std::exception& e) {
            std::cerr << "Error: Message serialization failed: " << e.what() << std::endl;
            return;
        }

        auto self = shared_from_this();
        boost::asio::post(io, [this, self, buf = std::move(buf), onWritten = std::move(onWritten)]() mutable {
            if (!isConnected() || closing) {
                return;
            }
            writeQueue.push_back(PendingWrite{std::move(buf), std::move(onWritten)});
            if (writeQueue.size() == 1) {
                doWrite();
            }
        });
    }

    void FrameConnection::doWrite() {
        auto self = shared_from_this();
        boost::asio::async_write(sock, boost::asio::buffer(writeQueue.front().frame),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    handleDisconnect("Send error: " + ec.message());
                    return;
                }

                auto written = std::move(writeQueue.front().onWritten);
                writeQueue.pop_front();
                if (written) {
                    written();
                }
                if (!isConnected()) {
                    return;
                }
                if (!writeQueue.empty()) {
                    doWrite();
                } else if (closing) {
                    handleDisconnect(closeReason);
                }
            });
    }

    void FrameConnection::close(const std::string& reason) {
        auto self = shared_from_this();
        boost::asio::post(io, [this, self, reason]() {
            if (closing) {
                return;
            }
            closing = true;
            closeReason = reason;
            if (writeQueue.empty()) {
                handleDisconnect(reason);
            }
        });
    }

    void FrameConnection::handleDisconnect(const std::string& reason) {
        if (!connected.exchange(false)) {
            return;
        }

        boost::system::error_code ec;
        if (sock.is_open()) {
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        }
        writeQueue.clear();

        // Handlers usually capture an owner that holds this connection
        auto closeCb = std::move(onClose);
        onClose = nullptr;
        onMessage = nullptr;

        if (closeCb) {
            try {
                closeCb(reason);
            } catch (const std::exception& e) {
                std::cerr << "Error in close handler: " << e.what() << std::endl;
            }
        }
    }

} // namespace airlink
