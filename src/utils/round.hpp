#pragma once

// torch
#include <torch/torch.h>

namespace psychro {

//! \brief Round half away from zero to a number of decimal places
/*!
 * Ties are decided on the double product value * 10^decimals, so
 * 8.645 -> 8.65 (8.645 * 100 == 864.5) and 1.005 -> 1.0
 * (1.005 * 100 < 100.5). Negative zero comes out as zero.
 */
torch::Tensor round_half_away(torch::Tensor value, int decimals);

double round_half_away(double value, int decimals);

}  // namespace psychro
