// C/C++
#include <map>
#include <ostream>

// yaml
#include <yaml-cpp/yaml.h>

// torch
#include <c10/util/Exception.h>

// psychro
#include "psychro_options.hpp"

namespace psychro {

std::vector<std::string> const property_names = {
    "absolute_humidity",
    "dewpoint",
    "wet_bulb",
    "enthalpy",
    "saturation_vapor_pressure",
    "vapor_pressure"};

std::string const& property_unit(std::string const& name) {
  static std::map<std::string, std::string> const units = {
      {"absolute_humidity", "g/m³"},
      {"dewpoint", "°C"},
      {"wet_bulb", "°C"},
      {"enthalpy", "kJ/kg"},
      {"saturation_vapor_pressure", "Pa"},
      {"vapor_pressure", "Pa"}};

  auto it = units.find(name);
  TORCH_CHECK(it != units.end(), "Unknown property '", name, "'");
  return it->second;
}

PsychroOptions PsychroOptions::from_yaml(std::string const& filename) {
  return from_yaml(YAML::LoadFile(filename));
}

PsychroOptions PsychroOptions::from_yaml(YAML::Node const& config) {
  PsychroOptions op;

  if (config["reference-state"]) {
    if (config["reference-state"]["pressure"])
      op.pressure(config["reference-state"]["pressure"].as<double>());
  }

  if (config["method"]) {
    op.method(config["method"].as<std::string>());
  }

  if (config["limits"]) {
    auto limits = config["limits"];
    if (limits["Tmin"]) op.Tmin(limits["Tmin"].as<double>());
    if (limits["Tmax"]) op.Tmax(limits["Tmax"].as<double>());
    if (limits["RHmin"]) op.RHmin(limits["RHmin"].as<int>());
    if (limits["RHmax"]) op.RHmax(limits["RHmax"].as<int>());
  }

  if (config["output"]) {
    auto output = config["output"];
    if (output["decimals"]) op.decimals(output["decimals"].as<int>());

    for (auto const& prop : output["properties"]) {
      auto name = prop.as<std::string>();
      if (name == "dewpoint") {
        op.dewpoint(true);
      } else if (name == "wet-bulb") {
        op.wet_bulb(true);
      } else if (name == "enthalpy") {
        op.enthalpy(true);
      } else if (name == "vapor-pressure") {
        op.vapor_pressure(true);
      } else {
        TORCH_CHECK(false, "Unknown output property '", name, "'");
      }
    }
  }

  if (config["solver"]) {
    auto solver = config["solver"];
    if (solver["max-iter"]) op.max_iter(solver["max-iter"].as<int>());
    if (solver["ftol"]) op.ftol(solver["ftol"].as<double>());
  }

  return op;
}

void PsychroOptions::report(std::ostream& os) const {
  os << "* pressure = " << pressure() << " Pa\n"
     << "* method = " << method() << "\n"
     << "* Tmin = " << Tmin() << " C\n"
     << "* Tmax = " << Tmax() << " C\n"
     << "* RHmin = " << RHmin() << " %\n"
     << "* RHmax = " << RHmax() << " %\n"
     << "* decimals = " << decimals() << "\n"
     << "* dewpoint = " << (dewpoint() ? "true" : "false") << "\n"
     << "* wet_bulb = " << (wet_bulb() ? "true" : "false") << "\n"
     << "* enthalpy = " << (enthalpy() ? "true" : "false") << "\n"
     << "* vapor_pressure = " << (vapor_pressure() ? "true" : "false") << "\n"
     << "* max_iter = " << max_iter() << "\n"
     << "* ftol = " << ftol() << "\n";
}

std::vector<std::string> PsychroOptions::properties() const {
  std::vector<std::string> props = {"absolute_humidity"};
  if (dewpoint()) props.push_back("dewpoint");
  if (wet_bulb()) props.push_back("wet_bulb");
  if (enthalpy()) props.push_back("enthalpy");
  if (vapor_pressure()) {
    props.push_back("saturation_vapor_pressure");
    props.push_back("vapor_pressure");
  }
  return props;
}

}  // namespace psychro
