// fmt
#include <fmt/format.h>

// psychro
#include <psychro/constants.h>
#include <psychro/errors.hpp>

#include "svp.hpp"

namespace psychro {

torch::Tensor saturation_vapor_pressure(torch::Tensor temp) {
  auto denom = temp + constants::Magnus_b;
  if ((denom == 0.).any().item<bool>()) {
    throw PsychroError(
        ErrorKind::Singularity,
        "saturation vapor pressure is undefined at -243.5 C (Magnus pole)");
  }
  auto svp = constants::Magnus_c * (constants::Magnus_a * temp / denom).exp();

  // just below the pole the exponent exceeds the double range
  auto bad = torch::isfinite(svp).logical_not();
  if (bad.any().item<bool>()) {
    throw PsychroError(
        ErrorKind::Singularity,
        fmt::format("saturation vapor pressure overflows at {} C, too close "
                    "below the Magnus pole",
                    temp.masked_select(bad)[0].item<double>()));
  }
  return svp;
}

double saturation_vapor_pressure(double temp) {
  return saturation_vapor_pressure(torch::tensor(temp, torch::kFloat64))
      .item<double>();
}

torch::Tensor dewpoint_from_vapor_pressure(torch::Tensor pvap) {
  if ((pvap <= 0.).any().item<bool>()) {
    throw PsychroError(ErrorKind::Singularity,
                       "dew point is undefined at zero vapor pressure");
  }

  auto lnr = (pvap / constants::Magnus_c).log();
  auto denom = constants::Magnus_a - lnr;
  if ((denom == 0.).any().item<bool>()) {
    throw PsychroError(ErrorKind::Singularity,
                       "dew point is undefined at ln(e/c) = a");
  }
  return constants::Magnus_b * lnr / denom;
}

double dewpoint_from_vapor_pressure(double pvap) {
  return dewpoint_from_vapor_pressure(torch::tensor(pvap, torch::kFloat64))
      .item<double>();
}

}  // namespace psychro
