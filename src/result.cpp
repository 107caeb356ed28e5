// fmt
#include <fmt/format.h>

// psychro
#include "psychro_options.hpp"
#include "result.hpp"

namespace psychro {

double PsychroResult::absolute_humidity() const {
  return properties.front().value;
}

std::string const& PsychroResult::unit() const {
  return properties.front().unit;
}

std::optional<double> PsychroResult::get(std::string const& name) const {
  for (auto const& p : properties) {
    if (p.name == name) return p.value;
  }
  return std::nullopt;
}

PsychroResult make_result(double temp, int rh,
                          std::map<std::string, torch::Tensor> const& out,
                          std::vector<std::string> const& names) {
  PsychroResult result;
  result.temperature = temp;
  result.humidity = rh;

  for (auto const& name : names) {
    result.properties.push_back(
        {name, out.at(name).item<double>(), property_unit(name)});
  }

  return result;
}

namespace {

// shortest text that reads back as the same double, 8.64 instead of
// 8.6400000000000006
YAML::Node number(double value) { return YAML::Node(fmt::format("{}", value)); }

}  // namespace

YAML::Node to_yaml(PsychroResult const& result) {
  YAML::Node node;
  for (auto const& p : result.properties) {
    node[p.name] = number(p.value);
  }
  node["temperature"] = number(result.temperature);
  node["humidity"] = result.humidity;
  node["unit"] = result.unit();

  if (result.properties.size() > 1) {
    for (auto const& p : result.properties) {
      node["units"][p.name] = p.unit;
    }
  }
  return node;
}

YAML::Node to_yaml(PsychroError const& error) {
  YAML::Node node;
  node["error"] = to_string(error.kind());
  node["message"] = error.what();
  node["client_fault"] = is_client_fault(error.kind());
  return node;
}

}  // namespace psychro
