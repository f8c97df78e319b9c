#pragma once
#include <vector>
#include <cstddef>
#include <optional>

namespace ind {

// Utolsó p elem átlaga; nullopt, ha nincs p elem
std::optional<double> compute_sma(const std::vector<double>& v, std::size_t p);

// EMA az első p elem SMA-jával seedelve; rövid sorozatnál a teljes sor átlaga
double compute_ema(const std::vector<double>& v, std::size_t p);

// Teljes EMA sor (a MACD signal vonalához kell); az első p-1 elem a seed előtt üres
std::vector<double> ema_series(const std::vector<double>& v, std::size_t p);

} // namespace ind
