// C/C++
#include <cmath>

// fmt
#include <fmt/format.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/thermo/moist_air.hpp>
#include <psychro/thermo/svp.hpp>
#include <psychro/thermo/wet_bulb.hpp>
#include <psychro/utils/round.hpp>
#include <psychro/validate/validate.hpp>

#include "psychro.hpp"

namespace psychro {

PsychrometricsImpl::PsychrometricsImpl(PsychroOptions const& options_)
    : options(options_) {
  reset();
}

void PsychrometricsImpl::reset() {
  TORCH_CHECK(std::isfinite(options.pressure()) && options.pressure() > 0.,
              "pressure must be positive, got ", options.pressure());

  TORCH_CHECK(options.decimals() >= 0 && options.decimals() <= 12,
              "decimals must be in [0, 12], got ", options.decimals());

  TORCH_CHECK(options.Tmin() >= -constants::T0 && options.Tmax() <= 1000. &&
                  options.Tmin() <= options.Tmax(),
              "temperature limits [", options.Tmin(), ", ", options.Tmax(),
              "] must lie inside [-273.15, 1000]");

  TORCH_CHECK(options.RHmin() >= 0 && options.RHmax() <= 100 &&
                  options.RHmin() <= options.RHmax(),
              "humidity limits [", options.RHmin(), ", ", options.RHmax(),
              "] must lie inside [0, 100]");

  TORCH_CHECK(options.method() == "vapor-pressure" ||
                  options.method() == "humidity-ratio",
              "Unknown absolute humidity method '", options.method(), "'");

  TORCH_CHECK(options.max_iter() > 0, "max_iter must be positive");
  TORCH_CHECK(options.ftol() > 0., "ftol must be positive");

  pres = register_buffer("pres",
                         torch::tensor(options.pressure(), torch::kFloat64));
}

void PsychrometricsImpl::pretty_print(std::ostream& os) const {
  os << "Psychrometrics(" << std::endl;
  options.report(os);
  os << ")";
}

std::map<std::string, torch::Tensor> PsychrometricsImpl::forward(
    torch::Tensor temp, torch::Tensor rh) const {
  temp = check_temperature(temp, options);
  rh = check_humidity(rh, options);
  auto ptot = pres.to(temp.device());

  std::map<std::string, torch::Tensor> out;

  try {
    auto e = vapor_pressure(temp, rh);
    auto pvap = e * 100.;

    if (options.method() == "humidity-ratio") {
      out["absolute_humidity"] =
          absolute_humidity_from_hum_ratio(temp, pvap, ptot);
    } else {
      out["absolute_humidity"] = absolute_humidity(temp, pvap);
    }

    if (options.dewpoint()) {
      out["dewpoint"] = dewpoint_from_vapor_pressure(e);
    }

    if (options.wet_bulb()) {
      out["wet_bulb"] = wet_bulb_temperature(temp, pvap, ptot,
                                             options.max_iter(), options.ftol());
    }

    if (options.enthalpy()) {
      out["enthalpy"] = moist_air_enthalpy(temp, humidity_ratio(pvap, ptot));
    }

    if (options.vapor_pressure()) {
      out["saturation_vapor_pressure"] =
          saturation_vapor_pressure(temp) * 100.;
      out["vapor_pressure"] = pvap;
    }
  } catch (c10::Error const& err) {
    throw PsychroError(ErrorKind::CalculationError,
                       err.what_without_backtrace());
  }

  for (auto& [name, value] : out) {
    if (!torch::isfinite(value).all().item<bool>()) {
      throw PsychroError(ErrorKind::CalculationError,
                         fmt::format("{} is not finite", name));
    }
    value = round_half_away(value, options.decimals());
  }

  out["temperature"] = temp;
  out["humidity"] = rh;
  return out;
}

PsychroResult PsychrometricsImpl::compute(double temp, double rh) const {
  temp = validate_temperature(temp, options);
  int irh = validate_humidity(rh, options);

  auto out = forward(torch::tensor(temp, torch::kFloat64),
                     torch::tensor(static_cast<double>(irh), torch::kFloat64));
  return make_result(temp, irh, out, options.properties());
}

PsychroResult PsychrometricsImpl::compute(YAML::Node const& temp,
                                          YAML::Node const& rh) const {
  return compute(validate_temperature(temp, options),
                 static_cast<double>(validate_humidity(rh, options)));
}

YAML::Node PsychrometricsImpl::info() const {
  YAML::Node node;
  node["name"] = "psychro";
  node["version"] = PSYCHRO_VERSION;
  node["description"] =
      "Absolute humidity and moist-air properties from dry-bulb temperature "
      "and relative humidity";

  auto methods = node["methods"];
  methods["saturation_vapor_pressure"] =
      "es = 6.112 * exp((17.67 * T) / (T + 243.5))";
  if (options.method() == "humidity-ratio") {
    methods["absolute_humidity"] =
        "AH = w * (P - e) / (287.042 * (T + 273.15)) * 1000";
  } else {
    methods["absolute_humidity"] =
        "AH = (e * 18.016) / (8314.5 * (T + 273.15)) * 1000";
  }
  methods["dewpoint"] = "Td = 243.5 * ln(e/6.112) / (17.67 - ln(e/6.112))";
  methods["enthalpy"] = "h = 1.006 * T + w * (2501 + 1.86 * T)";
  methods["wet_bulb"] = "bisection on the ASHRAE psychrometric equation";

  auto units = node["units"];
  units["temperature"] = "Celsius";
  units["humidity"] = "percentage (0-100)";
  units["result"] = property_unit("absolute_humidity");
  for (auto const& name : property_names) {
    units["properties"][name] = property_unit(name);
  }

  auto limits = node["limits"];
  limits["temperature_min"] = options.Tmin();
  limits["temperature_max"] = options.Tmax();
  limits["humidity_min"] = options.RHmin();
  limits["humidity_max"] = options.RHmax();

  node["pressure"] = options.pressure();
  node["precision"]["decimal_places"] = options.decimals();
  node["precision"]["rounding"] = "half away from zero";
  return node;
}

}  // namespace psychro
