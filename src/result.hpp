#pragma once

// C/C++
#include <map>
#include <optional>
#include <string>
#include <vector>

// torch
#include <torch/torch.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include "errors.hpp"

namespace psychro {

//! a rounded, unit-tagged output value
struct Property {
  std::string name;
  double value = 0.;
  std::string unit;
};

//! Outcome of one successful psychrometric call
struct PsychroResult {
  //! input temperature [C], echoed as given
  double temperature = 0.;

  //! validated relative humidity [%]
  int humidity = 0;

  //! computed properties, absolute humidity first
  std::vector<Property> properties;

  double absolute_humidity() const;

  //! unit of the absolute humidity
  std::string const& unit() const;

  std::optional<double> get(std::string const& name) const;
};

//! \brief Collect rounded scalar outputs of the engine into a result
/*!
 * \param temp echoed temperature, C
 * \param rh validated relative humidity, %
 * \param out output map of `Psychrometrics::forward`, 0-dim tensors
 * \param names properties to collect, in order
 */
PsychroResult make_result(double temp, int rh,
                          std::map<std::string, torch::Tensor> const& out,
                          std::vector<std::string> const& names);

YAML::Node to_yaml(PsychroResult const& result);

YAML::Node to_yaml(PsychroError const& error);

}  // namespace psychro
