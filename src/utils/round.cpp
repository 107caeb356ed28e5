// C/C++
#include <cmath>

// psychro
#include "round.hpp"

namespace psychro {

torch::Tensor round_half_away(torch::Tensor value, int decimals) {
  double scale = std::pow(10., decimals);
  auto mag = torch::floor(value.abs() * scale + 0.5) / scale;
  return torch::where(value < 0., -mag, mag) + 0.;
}

double round_half_away(double value, int decimals) {
  double scale = std::pow(10., decimals);
  double mag = std::floor(std::fabs(value) * scale + 0.5) / scale;
  return (value < 0. ? -mag : mag) + 0.;
}

}  // namespace psychro
