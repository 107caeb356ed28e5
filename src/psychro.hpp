#pragma once

// C/C++
#include <map>
#include <string>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// psychro
#include "psychro_options.hpp"
#include "result.hpp"

namespace YAML {
class Node;
}

namespace psychro {

//! Moist-air property engine
/*!
 * Stateless: every call is a pure function of its inputs and the options
 * the engine was constructed with, so one engine may serve any number of
 * concurrent callers.
 */
class PsychrometricsImpl : public torch::nn::Cloneable<PsychrometricsImpl> {
 public:
  //! total pressure [Pa], 0-dim
  torch::Tensor pres;

  //! options with which this `Psychrometrics` was constructed
  PsychroOptions options;

  PsychrometricsImpl() : PsychrometricsImpl(PsychroOptions()) {}
  explicit PsychrometricsImpl(PsychroOptions const& options_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  //! \brief Compute moist-air properties
  /*!
   * Runs validation, the saturation vapor pressure, the property chain and
   * the rounding for every element. Any failing element fails the whole
   * call.
   *
   * \param temp dry-bulb temperature, C, shape (...)
   * \param rh relative humidity, %, shape (...)
   * \return rounded properties keyed by name, plus the validated
   *         "temperature" and (truncated) "humidity"
   * \throw PsychroError
   */
  std::map<std::string, torch::Tensor> forward(torch::Tensor temp,
                                               torch::Tensor rh) const;

  //! \brief Compute one set of properties
  /*!
   * \param temp dry-bulb temperature, C
   * \param rh relative humidity, %, truncated toward zero
   * \throw PsychroError
   */
  PsychroResult compute(double temp, double rh) const;

  //! \brief Compute from loosely typed input, e.g. parsed text
  PsychroResult compute(YAML::Node const& temp, YAML::Node const& rh) const;

  //! \brief Description of the formulas, units, limits and precision
  YAML::Node info() const;
};
TORCH_MODULE(Psychrometrics);

}  // namespace psychro
