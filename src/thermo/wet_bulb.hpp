#pragma once

// torch
#include <torch/torch.h>

namespace psychro {

//! \brief Humidity ratio from dry-bulb and wet-bulb temperature
/*!
 * ASHRAE psychrometric equation, over water for Twb >= 0 C and over ice
 * below. The result is floored at 1e-7.
 *
 * \param temp dry-bulb temperature, C
 * \param twb wet-bulb temperature, C
 * \param pres total pressure, Pa
 */
torch::Tensor hum_ratio_from_wet_bulb(torch::Tensor temp, torch::Tensor twb,
                                      torch::Tensor pres);

//! \brief Wet-bulb temperature by bisection
/*!
 * The root is bracketed by the dew point and the dry-bulb temperature and
 * halved until the bracket is narrower than `ftol`.
 *
 * \param temp dry-bulb temperature, C
 * \param pvap vapor pressure, Pa
 * \param pres total pressure, Pa
 * \param max_iter maximum number of halvings
 * \param ftol bracket tolerance, K
 * \return wet-bulb temperature, C
 * \throw PsychroError ConvergenceFailure if max_iter is exceeded
 */
torch::Tensor wet_bulb_temperature(torch::Tensor temp, torch::Tensor pvap,
                                   torch::Tensor pres, int max_iter,
                                   double ftol);

}  // namespace psychro
