#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/interfaces.hpp"
#include "engine/scanner.hpp"
#include "indicators/snapshot.hpp"
#include "session/session.hpp"

// ts_ms,open,high,low,close[,volume] sorok; az első sor header
static bool load_csv(const std::string& path, const std::string& symbol, const std::string& interval,
                     std::vector<core::RawCandle>& out) {
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    std::getline(f, line);
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        std::stringstream ss(line);
        std::string x;
        core::RawCandle r;
        r.symbol = symbol;
        r.interval = interval;
        if (!std::getline(ss, x, ',')) continue;
        try { r.ts_ms = std::stoll(x); } catch (const std::exception&) { continue; }
        if (!std::getline(ss, r.open, ','))  continue;
        if (!std::getline(ss, r.high, ','))  continue;
        if (!std::getline(ss, r.low, ','))   continue;
        if (!std::getline(ss, r.close, ',')) continue;
        std::getline(ss, r.volume, ',');
        out.push_back(std::move(r));
    }
    return !out.empty();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Hasznalat: stratscan_replay <csv_path> [config.json] [symbol]\n";
        return 1;
    }
    const std::string path = argv[1];
    const std::string symbol = argc >= 4 ? argv[3] : "REPLAY";

    core::EngineConfig cfg;
    try {
        if (argc >= 3) cfg = core::load_config(argv[2]);
        core::init_logging(cfg.logging);
    } catch (const core::ConfigError& e) {
        std::cerr << "Konfiguracios hiba: " << e.what() << "\n";
        return 3;
    }

    std::vector<core::RawCandle> rows;
    if (!load_csv(path, symbol, core::to_string(cfg.scanner.interval), rows)) {
        std::cerr << "CSV betoltes sikertelen: " << path << "\n";
        return 2;
    }

    auto shared = std::make_shared<const core::EngineConfig>(cfg);
    ind::HistoryIndicatorProvider indicators(cfg.indicators, cfg.confluence.ema_periods);
    engine::ConfigAccountProvider account(cfg.scanner.equity, cfg.risk);
    engine::Scanner scanner(shared, indicators, account);
    engine::SymbolState state(symbol, cfg.validator.max_history);

    std::size_t signals = 0;
    for (const auto& r : rows) {
        if (scanner.on_candle(state, r) != core::RejectReason::None) continue;
        const auto session = sess::classify(r.ts_ms, cfg.session);
        if (session.families.empty()) continue;
        if (auto sig = scanner.scan(state, session, r.ts_ms)) {
            std::cout << nlohmann::json(*sig).dump() << "\n";
            ++signals;
        }
    }

    spdlog::info("replay done: rows={} rejected={} signals={}", rows.size(), state.rejected, signals);
    return 0;
}
