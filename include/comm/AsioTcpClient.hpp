#pragma once

/**
 * AsioTcpClient.hpp
 *
 * Boost.Asio 기반 ITcpClient 구현 (헤더)
 *
 * 설계 요약:
 *  - 생성자에서는 io_context/소켓 생성까지만 수행
 *  - connect(): io 스레드를 띄우고 async_connect + timeout. 실패 시 예외, 성공 시 TCP_NODELAY 설정
 *  - start(): async_read_until('\n')로 수신 시작
 *  - stop()/disconnect(): 안전 정리 (io_context.stop, thread join, socket close)
 *  - sendLine(): write strand에서 순서대로 송신 (스레드-안전)
 *  - 수신 라인이 MAX_LINE_BYTES를 넘으면 버퍼를 버리고 다음 개행에서 재동기화한다.
 */

#include "ITcpClient.hpp"

#include <memory>
#include <string>

namespace renkei::comm {

class AsioTcpClient : public ITcpClient {
public:
    static constexpr std::size_t MAX_LINE_BYTES = 64 * 1024;

    AsioTcpClient();
    ~AsioTcpClient() override;

    AsioTcpClient(const AsioTcpClient&) = delete;
    AsioTcpClient& operator=(const AsioTcpClient&) = delete;

    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
    void disconnect() override;

    void start() override;
    void stop() override;

    bool isConnected() const noexcept override;

    void registerRecvHandler(RecvHandler handler) override;
    void setOnDisconnect(DisconnectHandler handler) override;

    void sendLine(const std::string& line) override;

private:
    // 비공개: 구현(.cpp)에서 정의
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace renkei::comm
