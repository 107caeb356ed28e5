#pragma once

// torch
#include <torch/torch.h>

// psychro
#include <psychro/psychro_options.hpp>

namespace YAML {
class Node;
}

namespace psychro {

//! \brief Validate a dry-bulb temperature [C]
/*!
 * \param value temperature, C
 * \param op limits to check against
 * \return the temperature, unchanged
 * \throw PsychroError NonFinite or OutOfRange
 */
double validate_temperature(double value, PsychroOptions const& op = {});

//! \brief Validate a loosely typed temperature
/*!
 * Null, sequence, map, quoted text or any scalar that does not parse as a
 * number is rejected with InvalidType.
 */
double validate_temperature(YAML::Node const& node,
                            PsychroOptions const& op = {});

//! \brief Validate a relative humidity [%]
/*!
 * The range is checked on the raw value, which is then truncated toward
 * zero: 55.9 -> 55.
 *
 * \throw PsychroError NonFinite or OutOfRange
 */
int validate_humidity(double value, PsychroOptions const& op = {});

int validate_humidity(YAML::Node const& node, PsychroOptions const& op = {});

//! \brief Validate a temperature tensor, returned as float64
torch::Tensor check_temperature(torch::Tensor temp, PsychroOptions const& op);

//! \brief Validate a humidity tensor, returned truncated as float64
torch::Tensor check_humidity(torch::Tensor rh, PsychroOptions const& op);

}  // namespace psychro
