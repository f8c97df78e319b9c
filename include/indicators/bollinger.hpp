#pragma once
#include <vector>
#include <cstddef>
#include <optional>

namespace ind {

struct BB { double mid{}, upper{}, lower{}; };

// Utolsó p záróár átlaga ± k populációs szórás; nullopt, ha nincs p elem
std::optional<BB> compute_bb(const std::vector<double>& v, std::size_t p = 20, double k = 2.0);

} // namespace ind
