#pragma once

// C/C++
#include <optional>
#include <string>
#include <vector>

// psychro
#include "psychro.hpp"
#include "utils/parse_yaml.hpp"

namespace psychro {

//! result or error of one batch entry
struct BatchOutcome {
  std::optional<PsychroResult> result;
  std::optional<PsychroError> error;

  bool ok() const { return result.has_value(); }
};

//! \brief Run every sample as an independent call
/*!
 * A failing sample records its error and does not affect the others.
 */
std::vector<BatchOutcome> run_batch(PsychrometricsImpl const& engine,
                                    std::vector<Sample> const& samples);

//! \brief Process exit status for a batch
/*!
 * 0 if every sample succeeded, 2 if the worst failure is a client-input
 * fault, 3 if any sample hit a computation fault.
 */
int batch_status(std::vector<BatchOutcome> const& outcomes);

YAML::Node to_yaml(std::vector<BatchOutcome> const& outcomes);

}  // namespace psychro
