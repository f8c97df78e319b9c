#pragma once
#include "core/config.hpp"

namespace core {

// Alapértelmezett spdlog logger: színes konzol (stderr) + opcionális fájl
void init_logging(const LoggingConfig& cfg);

} // namespace core
