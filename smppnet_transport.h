#pragma once

#include "smppnet_config.h"
#include "smppnet_frame.h"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <string>
#include <thread>
#include <vector>

namespace smppnet {

// FrameTransport over a TCP socket. The read chain, the write queue and the
// timers all run on one strand; the only reader of the socket is the read chain.
class TcpFrameTransport : public FrameTransport {
public:
    explicit TcpFrameTransport(const SessionConfig& config);
    ~TcpFrameTransport() override;

    TcpFrameTransport(const TcpFrameTransport&) = delete;
    TcpFrameTransport& operator=(const TcpFrameTransport&) = delete;

    void open(const std::string& host, uint16_t port) override;
    void start(FrameHandler onFrame, StreamCloseHandler onClose) override;
    void writeFrame(std::vector<uint8_t> frame) override;
    void close() override;
    bool isOpen() const override;

private:
    // I/O methods
    void doReadHeader();
    void onReadHeader(const boost::system::error_code& ec, std::size_t bytesTransferred);
    void doReadBody(uint32_t bodyLen);
    void onReadBody(const boost::system::error_code& ec, std::size_t bytesTransferred);
    void doWrite();
    void onWrite(const boost::system::error_code& ec, std::size_t bytesTransferred);

    void startWriteTimer();
    void cancelWriteTimer();
    void onWriteTimeout(const boost::system::error_code& ec);

    // Both run on the strand.
    void fail(const boost::system::error_code& ec);
    void closeSocket();

    SessionConfig                                                            config_;
    boost::asio::io_context                                                  ioCtx_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    boost::asio::strand<boost::asio::io_context::executor_type>              strand_;
    boost::asio::ip::tcp::socket                                             socket_;
    boost::asio::steady_timer                                                connectTimer_;
    boost::asio::steady_timer                                                writeTimer_;
    std::vector<std::thread>                                                 ioThreads_;
    std::atomic<bool>                                                        open_{false};
    std::atomic<bool>                                                        running_{false};

    std::array<uint8_t, kLengthPrefixSize> headerBuf_;
    std::vector<uint8_t>                   bodyBuf_;
    std::deque<std::vector<uint8_t>>       writeQueue_;

    FrameHandler       onFrame_;
    StreamCloseHandler onClose_;
};

} // namespace smppnet
