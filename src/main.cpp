#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>

#include "engine_config.hpp"
#include "event_bus.hpp"
#include "log_sink.hpp"
#include "orchestrator.hpp"

using namespace shelfwatch;

static std::atomic_bool g_stop{ false };

static void on_sigint(int) { g_stop.store(true); }

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);
    std::signal(SIGPIPE, SIG_IGN); // 앱 쪽 소켓이 먼저 닫혀도 종료되지 않도록

    const std::string cfg_path = (argc > 1 ? argv[1] : "config/shelfwatch.json");

    LogSink log;
    JsonCatalog catalog;
    EngineConfig cfg;
    std::string err;
    if (!load_engine_config(cfg_path, catalog, cfg, &err)) {
        std::fprintf(stderr, "[main] config error: %s\n", err.c_str());
        return 1;
    }
    if (!cfg.log_path.empty() && !log.open(cfg.log_path)) {
        std::fprintf(stderr, "[main] cannot open log file %s, using stderr\n", cfg.log_path.c_str());
    }

    // ===== 전송 계층 (UDS) =====
    EventBus bus(cfg.peer_path);
    if (!bus.listen(cfg.uds_path)) {
        log.write("MAIN", "listen failed: " + cfg.uds_path);
        return 1;
    }

    // ===== 엔진 =====
    Orchestrator orc(cfg, bus, &log);
    if (!orc.start()) {
        log.write("MAIN", "orchestrator start failed");
        return 1;
    }
    log.write("MAIN", "listening on " + cfg.uds_path + " (" + std::to_string(catalog.get_items().size()) + " catalog items)");

    // 수신 루프: 타임아웃마다 종료 플래그 확인
    while (!g_stop.load()) {
        auto j = bus.receive(cfg.rx_timeout_ms);
        if (!j) continue;
        if (!bus.dispatch(*j)) log.write("BUS", "dropped envelope without a subscribed topic");
    }

    orc.stop();
    bus.close();
    log.write("MAIN", "bye");
    return 0;
}
