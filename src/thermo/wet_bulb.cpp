// fmt
#include <fmt/format.h>

// psychro
#include <psychro/constants.h>
#include <psychro/errors.hpp>

#include "moist_air.hpp"
#include "svp.hpp"
#include "wet_bulb.hpp"

namespace psychro {

torch::Tensor hum_ratio_from_wet_bulb(torch::Tensor temp, torch::Tensor twb,
                                      torch::Tensor pres) {
  auto psat = 100. * saturation_vapor_pressure(twb);
  auto ws = constants::eps * psat / (pres - psat);

  using namespace constants;

  // ASHRAE Fundamentals (2017) ch. 1 eq. 33 over water, eq. 35 over ice
  auto water =
      ((Lv0 - (cp_water - cp_vapor) * twb) * ws - cp_dry * (temp - twb)) /
      (Lv0 + cp_vapor * temp - cp_water * twb);
  auto ice = ((Ls0 - (cp_ice - cp_vapor) * twb) * ws - cp_dry * (temp - twb)) /
             (Ls0 + cp_vapor * temp - cp_ice * twb);

  return torch::where(twb >= 0., water, ice).clamp_min(constants::min_hum_ratio);
}

torch::Tensor wet_bulb_temperature(torch::Tensor temp, torch::Tensor pvap,
                                   torch::Tensor pres, int max_iter,
                                   double ftol) {
  auto w = humidity_ratio(pvap, pres).clamp_min(constants::min_hum_ratio);

  // dry air has no dew point, start just above the Magnus pole instead
  auto lowest = torch::full_like(temp, ftol - constants::Magnus_b);
  auto dry = pvap <= 0.;
  auto lo = torch::where(
      dry, lowest,
      dewpoint_from_vapor_pressure(torch::where(dry, torch::ones_like(pvap),
                                                pvap) / 100.));
  lo = torch::minimum(lo, temp);
  auto hi = temp.clone();

  int iter = 0;
  while ((hi - lo).max().item<double>() > ftol) {
    if (++iter > max_iter) {
      throw PsychroError(
          ErrorKind::ConvergenceFailure,
          fmt::format("wet-bulb bisection did not reach {} K in {} iterations",
                      ftol, max_iter));
    }

    auto mid = 0.5 * (lo + hi);
    auto above = hum_ratio_from_wet_bulb(temp, mid, pres) > w;
    hi = torch::where(above, mid, hi);
    lo = torch::where(above, lo, mid);
  }

  return 0.5 * (lo + hi);
}

}  // namespace psychro
