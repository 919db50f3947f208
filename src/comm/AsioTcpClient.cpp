#include "comm/AsioTcpClient.hpp"

#include <boost/asio.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include "spdlog/spdlog.h"

#include <atomic>
#include <future>
#include <istream>
#include <mutex>
#include <thread>

namespace renkei::comm {

struct AsioTcpClient::Impl {
    Impl()
        : ioContext_(),
          workGuard_(boost::asio::make_work_guard(ioContext_)),
          socket_(ioContext_),
          writeStrand_(boost::asio::make_strand(ioContext_)),
          readBuffer_(MAX_LINE_BYTES),
          connected_{false} {}

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::strand<boost::asio::io_context::executor_type> writeStrand_;
    boost::asio::streambuf readBuffer_;
    bool discarding_{false}; // io thread only: inside an oversized line

    std::thread thread_;
    std::mutex cbMtx_;
    std::atomic<bool> connected_;
    ITcpClient::RecvHandler recvHandler_;
    ITcpClient::DisconnectHandler onDisconnect_;

    bool onIoThread() const {
        return thread_.joinable() && thread_.get_id() == std::this_thread::get_id();
    }

    void startIoThread() {
        std::lock_guard<std::mutex> lk(cbMtx_);
        if (thread_.joinable()) return;
        thread_ = std::thread([this]() {
            try {
                ioContext_.run();
            } catch (const std::exception& ex) {
                spdlog::error("[AsioTcpClient] io_context.run() threw: {}", ex.what());
            }
        });
    }

    void stopIoThread() {
        workGuard_.reset();
        ioContext_.stop();
        if (thread_.joinable()) {
            if (onIoThread()) {
                spdlog::error("[AsioTcpClient] stop() called from io thread; detaching");
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

    void closeSocket() {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        if (ec) spdlog::debug("[AsioTcpClient] close: {}", ec.message());
    }

    // Fires the disconnect handler once per established connection.
    void linkLost(const std::string& reason) {
        if (!connected_.exchange(false)) return;
        DisconnectHandler cb;
        {
            std::lock_guard<std::mutex> lk(cbMtx_);
            cb = onDisconnect_;
        }
        if (!cb) return;
        try {
            cb(reason);
        } catch (const std::exception& ex) {
            spdlog::error("[AsioTcpClient] disconnect handler threw: {}", ex.what());
        }
    }

    void asyncReadLoop() {
        if (!socket_.is_open()) return;
        boost::asio::async_read_until(socket_, readBuffer_, '\n',
            [this](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec == boost::asio::error::operation_aborted) {
                    return; // closed locally
                }
                if (ec == boost::asio::error::not_found) {
                    // line longer than MAX_LINE_BYTES: drop it through the next '\n'
                    if (!discarding_) {
                        spdlog::warn("[AsioTcpClient] inbound line exceeds {} bytes; discarding",
                                     MAX_LINE_BYTES);
                    }
                    discarding_ = true;
                    readBuffer_.consume(readBuffer_.size());
                    asyncReadLoop();
                    return;
                }
                if (ec) {
                    if (ec == boost::asio::error::eof) {
                        spdlog::info("Connection closed by motor");
                    } else {
                        spdlog::error("[AsioTcpClient] read error: {}", ec.message());
                    }
                    linkLost(ec == boost::asio::error::eof ? "connection closed by peer" : ec.message());
                    return;
                }

                std::string line;
                {
                    std::istream is(&readBuffer_);
                    std::getline(is, line);
                }
                if (!line.empty() && line.back() == '\r') line.pop_back();

                if (discarding_) {
                    // tail of the oversized line
                    discarding_ = false;
                } else if (!line.empty()) {
                    ITcpClient::RecvHandler handler;
                    {
                        std::lock_guard<std::mutex> lk(cbMtx_);
                        handler = recvHandler_;
                    }
                    if (handler) {
                        try {
                            handler(line);
                        } catch (const std::exception& ex) {
                            spdlog::error("[AsioTcpClient] recv handler threw: {}", ex.what());
                        }
                    }
                }
                asyncReadLoop();
            });
    }
};

AsioTcpClient::AsioTcpClient()
    : impl_(std::make_unique<Impl>()) {}

AsioTcpClient::~AsioTcpClient() {
    stop();
    impl_->closeSocket();
}

void AsioTcpClient::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    namespace asio = boost::asio;
    using asio::ip::tcp;

    boost::system::error_code ec;
    tcp::resolver resolver(impl_->ioContext_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw std::runtime_error("[AsioTcpClient] resolve " + host + " failed: " + ec.message());
    }

    impl_->startIoThread();

    auto done = std::make_shared<std::promise<boost::system::error_code>>();
    auto fut = done->get_future();
    asio::post(impl_->ioContext_, [this, endpoints, done]() {
        asio::async_connect(impl_->socket_, endpoints,
            [done](const boost::system::error_code& err, const tcp::endpoint&) {
                done->set_value(err);
            });
    });

    if (fut.wait_for(timeout) != std::future_status::ready) {
        asio::post(impl_->ioContext_, [this]() { impl_->closeSocket(); });
        fut.wait();
        throw std::runtime_error("[AsioTcpClient] connect to " + host + ":" + std::to_string(port) +
                                 " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    ec = fut.get();
    if (ec) {
        throw std::runtime_error("[AsioTcpClient] connect to " + host + ":" + std::to_string(port) +
                                 " failed: " + ec.message());
    }

    impl_->socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        spdlog::warn("[AsioTcpClient] TCP_NODELAY not set: {}", ec.message());
    } else {
        spdlog::debug("TCP_NODELAY enabled");
    }
    impl_->connected_.store(true);
}

void AsioTcpClient::start() {
    if (!impl_->connected_.load()) {
        throw std::runtime_error("AsioTcpClient::start: not connected");
    }
    impl_->startIoThread();
    boost::asio::post(impl_->ioContext_, [this]() {
        impl_->discarding_ = false;
        impl_->asyncReadLoop();
    });
}

void AsioTcpClient::stop() {
    impl_->stopIoThread();
}

void AsioTcpClient::disconnect() {
    impl_->connected_.store(false);
    if (impl_->thread_.joinable() && !impl_->onIoThread() && !impl_->ioContext_.stopped()) {
        // close on the io thread so it never races an in-flight async operation
        auto closed = std::make_shared<std::promise<void>>();
        auto fut = closed->get_future();
        boost::asio::post(impl_->ioContext_, [this, closed]() {
            impl_->closeSocket();
            closed->set_value();
        });
        if (fut.wait_for(std::chrono::seconds(2)) == std::future_status::ready) return;
        spdlog::warn("[AsioTcpClient] io thread did not close the socket; stopping it");
        impl_->stopIoThread();
    }
    impl_->closeSocket();
}

bool AsioTcpClient::isConnected() const noexcept {
    return impl_->connected_.load();
}

void AsioTcpClient::registerRecvHandler(RecvHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->cbMtx_);
    impl_->recvHandler_ = std::move(handler);
}

void AsioTcpClient::setOnDisconnect(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->cbMtx_);
    impl_->onDisconnect_ = std::move(handler);
}

void AsioTcpClient::sendLine(const std::string& line) {
    if (!impl_->connected_.load()) throw std::runtime_error("AsioTcpClient::sendLine: not connected");

    auto out = std::make_shared<std::string>(line);
    if (out->empty() || out->back() != '\n') out->push_back('\n');

    boost::asio::post(impl_->writeStrand_, [this, out]() {
        boost::system::error_code ec;
        boost::asio::write(impl_->socket_, boost::asio::buffer(*out), ec);
        if (ec) {
            spdlog::error("[AsioTcpClient] write error: {}", ec.message());
            impl_->linkLost("write failed: " + ec.message());
            return;
        }
        spdlog::debug("Sent: {}", out->substr(0, out->size() - 1));
    });
}

} // namespace renkei::comm
