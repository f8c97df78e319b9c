#include "core/logging.hpp"
#include <vector>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace core {

void init_logging(const LoggingConfig& cfg){
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!cfg.file.empty()){
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
        } catch (const spdlog::spdlog_ex& e){
            throw ConfigError(fmt::format("cannot open log file {}: {}", cfg.file, e.what()));
        }
    }
    auto logger = std::make_shared<spdlog::logger>("stratscan", sinks.begin(), sinks.end());

    const auto lvl = spdlog::level::from_str(cfg.level);
    // from_str ismeretlen névre off-ot ad
    if (lvl == spdlog::level::off && cfg.level != "off")
        throw ConfigError(fmt::format("logging.level: unknown level '{}'", cfg.level));
    logger->set_level(lvl);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(std::move(logger));
}

} // namespace core
