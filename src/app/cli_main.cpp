// src/app/cli_main.cpp
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <atomic>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>

#include <sys/select.h>
#include <unistd.h>

#include "controller/RenkeiClient.h"
#include "spdlog/spdlog.h"

using namespace renkei;
using renkei::controller::RenkeiClient;
using renkei::protocol::MotorStatus;

static std::atomic<bool> g_stop{false};

void sigint_handler(int /*signum*/) {
    // 시그널 핸들러에서는 안전한 동작(atomic flag 설정)만 수행
    g_stop.store(true);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_seconds(const std::string& s, config::ms& out) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size()) return false;
        out = config::fromSeconds(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static void print_status(const MotorStatus& st) {
    auto field = [](const char* name, const auto& v) {
        std::cout << " " << name << "=";
        if (v.has_value()) std::cout << *v;
        else std::cout << "N/A";
    };
    field("current_pos", st.currentPos);
    field("limit_pos", st.limitPos);
    field("target_pos", st.targetPos);
    field("run_flags", st.runFlags);
    field("err_flags", st.errFlags);
    if (st.percent.has_value()) std::cout << " percent=" << *st.percent;
}

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " --host <ip> [--port <n>] [--reconnect <s>] [--health <s>] [--stabilise <s>] [--verbose]\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  help                        : show this help\n"
              << "  move <pct> [delay_s]        : move to percent position (0-100, delay 0-30 s)\n"
              << "  amove <pos> [delay_ms]      : move to encoder position (0-65536, delay 0-10000 ms)\n"
              << "  stop                        : stop the motor\n"
              << "  jog [count]                 : jog the motor (1-10)\n"
              << "  status                      : query motor status\n"
              << "  info                        : query device information\n"
              << "  state                       : print connection state and last snapshot\n"
              << "  quit                        : exit CLI\n";
}

/**
 * run_command:
 *  - 한 줄 명령을 RenkeiClient 호출로 변환한다.
 *  - 호출은 응답이 올 때까지 블록된다 (commandTimeout 상한).
 *  - 에러는 출력만 하고 CLI는 계속 동작한다.
 */
static bool run_command(RenkeiClient& client, const std::vector<std::string>& toks, const MotorStatus& last) {
    const std::string& cmd = toks[0];
    try {
        if (cmd == "help") {
            print_help();
        } else if (cmd == "move") {
            int pct = 0;
            int delay = 0;
            if (toks.size() < 2 || !parse_int(toks[1], pct) || (toks.size() >= 3 && !parse_int(toks[2], delay))) {
                std::cerr << "[CLI] usage: move <pct> [delay_s]\n";
                return true;
            }
            auto data = client.move(pct, delay);
            std::cout << "[CLI] MOVE ok " << data.dump() << "\n";
        } else if (cmd == "amove") {
            int pos = 0;
            int delay = 0;
            if (toks.size() < 2 || !parse_int(toks[1], pos) || (toks.size() >= 3 && !parse_int(toks[2], delay))) {
                std::cerr << "[CLI] usage: amove <pos> [delay_ms]\n";
                return true;
            }
            auto data = client.absoluteMove(pos, delay);
            std::cout << "[CLI] A_MOVE ok " << data.dump() << "\n";
        } else if (cmd == "stop") {
            auto data = client.stop();
            std::cout << "[CLI] STOP ok " << data.dump() << "\n";
        } else if (cmd == "jog") {
            int count = 1;
            if (toks.size() >= 2 && !parse_int(toks[1], count)) {
                std::cerr << "[CLI] usage: jog [count]\n";
                return true;
            }
            auto data = client.jog(count);
            std::cout << "[CLI] JOG ok " << data.dump() << "\n";
        } else if (cmd == "status") {
            auto st = client.getStatus();
            std::cout << "[CLI] status:";
            print_status(st);
            std::cout << "\n";
        } else if (cmd == "info") {
            auto info = client.getInfo();
            std::cout << "[CLI] " << info.deviceName() << " ip=" << info.ip << " mac=" << info.mac
                      << " firmware=" << info.firmware << "\n";
        } else if (cmd == "state") {
            std::cout << "[CLI] connection=" << client.state();
            auto seen = client.lastSeen();
            if (seen) {
                auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - *seen).count();
                std::cout << " last_seen=" << age << "ms";
            } else {
                std::cout << " last_seen=N/A";
            }
            if (client.justReconnected()) std::cout << " (just reconnected)";
            std::cout << "\n[CLI] last snapshot:";
            print_status(last);
            std::cout << "\n";
        } else if (cmd == "quit" || cmd == "exit") {
            std::cout << "[CLI] quitting...\n";
            return false;
        } else {
            std::cerr << "[CLI] unknown command: " << cmd << " (type 'help')\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[CLI] " << cmd << " failed: " << e.what() << "\n";
    }
    return true;
}

int main(int argc, char** argv) {
    config::ClientConfig cfg;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--host" && next(value)) {
            cfg.host = value;
        } else if (arg == "--port" && next(value)) {
            int p = 0;
            if (!parse_int(value, p) || p <= 0 || p > 65535) {
                std::cerr << "[CLI] invalid port: " << value << "\n";
                return 2;
            }
            cfg.port = static_cast<uint16_t>(p);
        } else if (arg == "--reconnect" && next(value)) {
            if (!parse_seconds(value, cfg.reconnectInterval)) {
                std::cerr << "[CLI] invalid reconnect interval: " << value << "\n";
                return 2;
            }
        } else if (arg == "--health" && next(value)) {
            if (!parse_seconds(value, cfg.healthCheckInterval)) {
                std::cerr << "[CLI] invalid health check interval: " << value << "\n";
                return 2;
            }
        } else if (arg == "--stabilise" && next(value)) {
            if (!parse_seconds(value, cfg.stabiliseDelay)) {
                std::cerr << "[CLI] invalid stabilise delay: " << value << "\n";
                return 2;
            }
        } else {
            usage(argv[0]);
            return 2;
        }
    }
    if (cfg.host.empty()) {
        usage(argv[0]);
        return 2;
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    std::unique_ptr<RenkeiClient> client;
    try {
        client = std::make_unique<RenkeiClient>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[CLI] invalid configuration: " << e.what() << "\n";
        return 2;
    }

    // install SIGINT handler for graceful shutdown (handler only sets flag)
    std::signal(SIGINT, sigint_handler);

    // 콜백은 Dispatcher 스레드에서 호출된다. last는 그 스레드에서만 갱신.
    auto last = std::make_shared<MotorStatus>();
    auto lastMtx = std::make_shared<std::mutex>();
    client->registerStatusCallback([last, lastMtx](const MotorStatus& st) {
        {
            std::lock_guard<std::mutex> lk(*lastMtx);
            *last = last->merge(st);
        }
        std::cout << "\n[STATUS]";
        print_status(st);
        std::cout << std::endl << "> " << std::flush; // prompt
    });
    client->registerConnectionCallback([](ConnectionState st) {
        std::cout << "\n[CONN] " << st << std::endl << "> " << std::flush;
    });

    std::cout << "[CLI] Connecting to " << cfg.host << ":" << cfg.port << " ...\n";
    client->connect();
    if (!client->waitUntilConnected(cfg.connectTimeout + cfg.stabiliseDelay)) {
        std::cerr << "[CLI] not connected yet; reconnecting every "
                  << cfg.reconnectInterval.count() << " ms in the background\n";
    }

    std::cout << "renkei CLI\n";
    std::cout << "Type 'help' for commands.\n";

    // Main interactive loop using select() so we can wake periodically and check g_stop
    const int STDIN_FD = fileno(stdin);
    std::string line;
    while (!g_stop.load()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000; // 200 ms

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv == -1) {
            if (g_stop.load()) break;
            continue;
        } else if (rv == 0) {
            continue;
        }
        if (!FD_ISSET(STDIN_FD, &readfds)) continue;
        if (!std::getline(std::cin, line)) {
            // EOF or error -> exit loop
            break;
        }
        auto toks = split_ws(line);
        if (toks.empty()) continue;

        MotorStatus snapshot;
        {
            std::lock_guard<std::mutex> lk(*lastMtx);
            snapshot = *last;
        }
        if (!run_command(*client, toks, snapshot)) break;
    } // main loop

    // Graceful shutdown performed from main thread
    try {
        client->disconnect();
    } catch (const std::exception& e) {
        std::cerr << "[CLI] disconnect error: " << e.what() << "\n";
    }
    std::cout << "[CLI] exited\n";
    return 0;
}
