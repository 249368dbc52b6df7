#include "smppnet_transport.h"
#include "smppnet_error.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <future>
#include <iostream>
#include <memory>

namespace smppnet {

TcpFrameTransport::TcpFrameTransport(const SessionConfig& config)
    : config_(config),
      ioCtx_(),
      workGuard_(boost::asio::make_work_guard(ioCtx_)),
      strand_(boost::asio::make_strand(ioCtx_)),
      socket_(ioCtx_),
      connectTimer_(ioCtx_),
      writeTimer_(ioCtx_) {
    for (std::size_t i = 0; i < config_.ioThreads; ++i) {
        ioThreads_.emplace_back([this] { ioCtx_.run(); });
    }
}

TcpFrameTransport::~TcpFrameTransport() {
    close();
    workGuard_.reset();
    ioCtx_.stop();
    for (auto& t : ioThreads_) if (t.joinable()) t.join();
}

void TcpFrameTransport::open(const std::string& host, uint16_t port) {
    if (open_) {
        throw SessionError(error::Code::usage_error, "transport already open");
    }

    struct ConnectState {
        std::promise<boost::system::error_code> done;
        bool                                    timedOut{false};
        bool                                    finished{false};
    };
    auto state = std::make_shared<ConnectState>();
    auto result = state->done.get_future();

    boost::asio::post(strand_, [this, host, port, state] {
        boost::system::error_code ec;
        boost::asio::ip::tcp::resolver resolver(ioCtx_);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            state->done.set_value(ec);
            return;
        }

        connectTimer_.expires_after(config_.connectTimeout);
        connectTimer_.async_wait(boost::asio::bind_executor(strand_, [this, state](const boost::system::error_code& timerEc) {
            // An expiry queued just before the connect completed must not close the new socket.
            if (timerEc || state->finished) return;
            state->timedOut = true;
            boost::system::error_code ignored;
            socket_.close(ignored);
        }));

        boost::asio::async_connect(socket_, endpoints,
            boost::asio::bind_executor(strand_, [this, state](const boost::system::error_code& connectEc,
                                                              const boost::asio::ip::tcp::endpoint&) {
                state->finished = true;
                boost::system::error_code ignored;
                connectTimer_.cancel(ignored);
                if (state->timedOut) {
                    state->done.set_value(boost::asio::error::timed_out);
                } else {
                    state->done.set_value(connectEc);
                }
            }));
    });

    boost::system::error_code ec = result.get();
    if (ec) {
        throw SessionError(error::Code::connection_refused,
                           host + ":" + std::to_string(port) + ": " + ec.message());
    }
    open_ = true;
    if (config_.verbose) std::cout << "[smppnet] Connected to " << host << ":" << port << std::endl;
}

void TcpFrameTransport::start(FrameHandler onFrame, StreamCloseHandler onClose) {
    if (!open_) {
        throw SessionError(error::Code::not_connected, "cannot start reading a closed transport");
    }
    boost::asio::post(strand_, [this, onFrame = std::move(onFrame), onClose = std::move(onClose)]() mutable {
        onFrame_ = std::move(onFrame);
        onClose_ = std::move(onClose);
        running_ = true;
        doReadHeader();
    });
}

void TcpFrameTransport::writeFrame(std::vector<uint8_t> frame) {
    if (!open_) {
        throw SessionError(error::Code::not_connected, "cannot write to a closed transport");
    }
    boost::asio::post(strand_, [this, frame = std::move(frame)]() mutable {
        if (!open_) return;
        bool writing = !writeQueue_.empty();
        writeQueue_.push_back(std::move(frame));
        if (!writing) doWrite();
    });
}

void TcpFrameTransport::close() {
    if (ioCtx_.stopped()) return;
    std::promise<void> done;
    auto closed = done.get_future();
    boost::asio::dispatch(strand_, [this, &done] {
        running_ = false;
        open_ = false;
        closeSocket();
        writeQueue_.clear();
        done.set_value();
    });
    closed.wait();
}

bool TcpFrameTransport::isOpen() const {
    return open_;
}

// I/O Implementation
void TcpFrameTransport::doReadHeader() {
    boost::asio::async_read(socket_, boost::asio::buffer(headerBuf_),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec, std::size_t n) {
            onReadHeader(ec, n);
        }));
}

void TcpFrameTransport::onReadHeader(const boost::system::error_code& ec, std::size_t bytesTransferred) {
    if (!running_ || ec == boost::asio::error::operation_aborted) return;
    if (ec == boost::asio::error::eof) {
        if (bytesTransferred == 0) {
            fail(error::make_error_code(error::Code::end_of_stream));
        } else {
            std::cerr << "[smppnet] Connection closed after " << bytesTransferred
                      << " bytes of a length prefix" << std::endl;
            fail(error::make_error_code(error::Code::framing_error));
        }
        return;
    }
    if (ec) {
        std::cerr << "[smppnet] Header read error: " << ec.message() << std::endl;
        fail(ec);
        return;
    }

    uint32_t length = readLengthPrefix(headerBuf_.data());
    try {
        checkFrameLength(length, config_.maxFrameLength);
    } catch (const SessionError& e) {
        std::cerr << "[smppnet] " << e.what() << std::endl;
        fail(e.code());
        return;
    }
    doReadBody(length - static_cast<uint32_t>(kLengthPrefixSize));
}

void TcpFrameTransport::doReadBody(uint32_t bodyLen) {
    bodyBuf_.resize(bodyLen);
    boost::asio::async_read(socket_, boost::asio::buffer(bodyBuf_),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec, std::size_t n) {
            onReadBody(ec, n);
        }));
}

void TcpFrameTransport::onReadBody(const boost::system::error_code& ec, std::size_t bytesTransferred) {
    if (!running_ || ec == boost::asio::error::operation_aborted) return;
    if (ec == boost::asio::error::eof) {
        std::cerr << "[smppnet] Connection closed mid-frame (" << bytesTransferred << " of "
                  << bodyBuf_.size() << " body bytes)" << std::endl;
        fail(error::make_error_code(error::Code::framing_error));
        return;
    }
    if (ec) {
        std::cerr << "[smppnet] Body read error: " << ec.message() << std::endl;
        fail(ec);
        return;
    }

    std::vector<uint8_t> frame;
    frame.reserve(kLengthPrefixSize + bodyBuf_.size());
    frame.insert(frame.end(), headerBuf_.begin(), headerBuf_.end());
    frame.insert(frame.end(), bodyBuf_.begin(), bodyBuf_.end());
    if (onFrame_) onFrame_(std::move(frame));

    if (running_) doReadHeader();
}

void TcpFrameTransport::doWrite() {
    startWriteTimer();
    boost::asio::async_write(socket_, boost::asio::buffer(writeQueue_.front()),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec, std::size_t n) {
            onWrite(ec, n);
        }));
}

void TcpFrameTransport::onWrite(const boost::system::error_code& ec, std::size_t bytesTransferred) {
    cancelWriteTimer();
    if (!open_) return;
    if (ec) {
        std::cerr << "[smppnet] Write error: " << ec.message() << std::endl;
        fail(ec);
        return;
    }
    if (bytesTransferred != writeQueue_.front().size()) {
        std::cerr << "[smppnet] Short write: " << bytesTransferred << " of "
                  << writeQueue_.front().size() << " bytes" << std::endl;
        fail(boost::system::errc::make_error_code(boost::system::errc::io_error));
        return;
    }
    writeQueue_.pop_front();
    if (!writeQueue_.empty()) doWrite();
}

// Timer Implementation
void TcpFrameTransport::startWriteTimer() {
    if (config_.writeTimeout.count() <= 0) return;
    writeTimer_.expires_after(config_.writeTimeout);
    writeTimer_.async_wait(boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec) {
        onWriteTimeout(ec);
    }));
}

void TcpFrameTransport::cancelWriteTimer() {
    boost::system::error_code ec;
    writeTimer_.cancel(ec);
}

void TcpFrameTransport::onWriteTimeout(const boost::system::error_code& ec) {
    if (ec || !open_) return;
    std::cerr << "[smppnet] Write timed out after " << config_.writeTimeout.count() << " ms" << std::endl;
    fail(boost::asio::error::timed_out);
}

void TcpFrameTransport::fail(const boost::system::error_code& ec) {
    bool wasOpen = open_.exchange(false);
    running_ = false;
    closeSocket();
    writeQueue_.clear();
    if (wasOpen && onClose_) onClose_(ec);
}

void TcpFrameTransport::closeSocket() {
    boost::system::error_code ignored;
    connectTimer_.cancel(ignored);
    writeTimer_.cancel(ignored);
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

} // namespace smppnet
