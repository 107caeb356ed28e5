// fmt
#include <fmt/format.h>

// psychro
#include <psychro/constants.h>
#include <psychro/errors.hpp>
#include <psychro/utils/round.hpp>

#include "moist_air.hpp"
#include "svp.hpp"

namespace psychro {

namespace {

// dry elements carry no water, so zero Kelvin is only singular where pvap > 0
torch::Tensor to_kelvin(torch::Tensor temp, torch::Tensor pvap) {
  auto tk = temp + constants::T0;
  if ((tk == 0.).logical_and(pvap != 0.).any().item<bool>()) {
    throw PsychroError(ErrorKind::Singularity,
                       "ideal-gas density is undefined at -273.15 C");
  }
  return tk;
}

torch::Tensor zero_where_dry(torch::Tensor ah, torch::Tensor pvap) {
  return torch::where(pvap == 0., torch::zeros_like(ah), ah);
}

}  // namespace

torch::Tensor vapor_pressure(torch::Tensor temp, torch::Tensor rh) {
  // keep dry elements away from the Magnus formula so that e(T, 0) = 0
  // for every T, including at and below the pole
  auto dry = rh == 0.;
  auto t = torch::where(dry, torch::zeros_like(temp), temp);
  return torch::where(dry, torch::zeros_like(rh),
                      rh / 100. * saturation_vapor_pressure(t));
}

torch::Tensor absolute_humidity(torch::Tensor temp, torch::Tensor pvap) {
  auto tk = to_kelvin(temp, pvap);
  // kg/m^3 -> g/m^3
  return zero_where_dry(pvap * constants::Mw / (constants::Rgas * tk) * 1.e3,
                        pvap);
}

torch::Tensor absolute_humidity_from_hum_ratio(torch::Tensor temp,
                                               torch::Tensor pvap,
                                               torch::Tensor pres) {
  auto tk = to_kelvin(temp, pvap);
  auto w = humidity_ratio(pvap, pres);
  auto rho_dry = (pres - pvap) / (constants::Rd * tk);
  return zero_where_dry(w * rho_dry * 1.e3, pvap);
}

double absolute_humidity(double temp, int rh) {
  auto t = torch::tensor(temp, torch::kFloat64);
  auto e = vapor_pressure(t, torch::tensor(rh, torch::kFloat64));
  return round_half_away(absolute_humidity(t, 100. * e).item<double>(), 2);
}

torch::Tensor humidity_ratio(torch::Tensor pvap, torch::Tensor pres) {
  auto bad = pvap >= pres;
  if (bad.any().item<bool>()) {
    throw PsychroError(
        ErrorKind::OutOfRange,
        fmt::format("vapor pressure {} Pa is not below total pressure",
                    pvap.masked_select(bad)[0].item<double>()));
  }
  return constants::eps * pvap / (pres - pvap);
}

torch::Tensor moist_air_enthalpy(torch::Tensor temp, torch::Tensor hum_ratio) {
  return constants::cp_dry * temp +
         hum_ratio * (constants::Lv0 + constants::cp_vapor * temp);
}

}  // namespace psychro
