#pragma once

/**
 * ITcpClient.hpp
 *
 * 통신 추상 인터페이스 (line-oriented transport)
 *
 * 핵심 포인트:
 *  - connect()/disconnect() : 연결 수립/종료
 *  - start()/stop() : 수신 루프 시작과 io 스레드 정지 (생명주기 제어)
 *  - registerRecvHandler(...) : '\n' 단위로 수신된 라인 콜백 등록
 *  - setOnDisconnect(...) : EOF / socket error 시 1회 호출
 *  - sendLine(...) : 스레드-안전한 라인 단위 송신
 *
 * 설계 의도:
 *  - 생성자에서는 스레드/IO를 시작하지 않음.
 *  - 한 인스턴스는 한 번의 연결만 담당한다. 재연결은 새 인스턴스로 수행한다.
 *  - ConnectionStateMachine은 factory로 인스턴스를 만들므로 테스트에서 fake로 교체할 수 있다.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace renkei::comm {

class ITcpClient {
public:
    using RecvHandler = std::function<void(const std::string& line)>; // 개행 제거된 라인
    using DisconnectHandler = std::function<void(const std::string& reason)>;

    virtual ~ITcpClient() = default;

    /// 서버에 연결을 시도한다. timeout 내에 연결되지 않거나 실패하면 std::runtime_error를 던진다.
    virtual void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;

    /// 연결을 끊고 소켓을 닫는다. disconnect handler는 호출하지 않는다.
    virtual void disconnect() = 0;

    /**
     * start(): 수신 비동기 루프(async_read_until('\n'))를 활성화한다.
     * stop(): 백그라운드 스레드를 정지하고, 모든 비동기 작업을 중단/정리한다.
     *
     * connect() 후 start()를 호출한다.
     */
    virtual void start() = 0;
    virtual void stop() = 0;

    /// 현재 연결 상태를 스레드-안전하게 반환
    virtual bool isConnected() const noexcept = 0;

    /**
     * recv handler 등록
     * - 인자로 전달되는 문자열은 개행('\n', 선택적 '\r')이 제거된 '한 라인'입니다.
     * - 호출 스레드: 수신 루프(io 스레드). 무거운 처리는 offload 하세요.
     */
    virtual void registerRecvHandler(RecvHandler handler) = 0;

    /// 원격 종료/에러로 연결이 끊어질 때 한 번 호출된다 (io 스레드).
    virtual void setOnDisconnect(DisconnectHandler handler) = 0;

    /**
     * 안전한 라인 전송 API
     * - '\n'이 없으면 구현체가 붙여서 전송한다.
     * - 연결되지 않은 상태면 std::runtime_error.
     * - 전송 자체의 실패는 disconnect handler로 보고된다.
     */
    virtual void sendLine(const std::string& line) = 0;
};

} // namespace renkei::comm
