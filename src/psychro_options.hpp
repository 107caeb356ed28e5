#pragma once

// C/C++
#include <iosfwd>
#include <string>
#include <vector>

// psychro
#include <psychro/constants.h>

// arg
#include <psychro/add_arg.h>

namespace YAML {
class Node;
}

namespace psychro {

//! names of the properties the engine can compute
extern std::vector<std::string> const property_names;

//! unit label of a property
std::string const& property_unit(std::string const& name);

struct PsychroOptions {
  //! \brief Create a `PsychroOptions` object from a YAML file
  /*!
   * All sections are optional:
   *  - "reference-state": total pressure [Pa]
   *  - "method": "vapor-pressure" or "humidity-ratio"
   *  - "limits": Tmin, Tmax [C], RHmin, RHmax [%]
   *  - "output": decimals and list of extra properties
   *  - "solver": max-iter and ftol of the wet-bulb solver
   */
  static PsychroOptions from_yaml(std::string const& filename);
  static PsychroOptions from_yaml(YAML::Node const& config);

  PsychroOptions() = default;

  void report(std::ostream& os) const;

  //! names of the properties these options ask for, in output order
  std::vector<std::string> properties() const;

  ADD_ARG(double, pressure) = constants::Pstd;
  ADD_ARG(int, decimals) = 2;

  ADD_ARG(double, Tmin) = -constants::T0;
  ADD_ARG(double, Tmax) = 1000.;
  ADD_ARG(int, RHmin) = 0;
  ADD_ARG(int, RHmax) = 100;

  ADD_ARG(std::string, method) = "vapor-pressure";

  ADD_ARG(bool, dewpoint) = false;
  ADD_ARG(bool, wet_bulb) = false;
  ADD_ARG(bool, enthalpy) = false;
  ADD_ARG(bool, vapor_pressure) = false;

  ADD_ARG(int, max_iter) = 100;
  ADD_ARG(double, ftol) = 1.e-3;
};

}  // namespace psychro

#undef ADD_ARG
