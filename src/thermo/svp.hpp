#pragma once

// torch
#include <torch/torch.h>

namespace psychro {

//! \brief Saturation vapor pressure over water (Magnus)
/*!
 * $ e_s = c \exp\left(\frac{a T}{T + b}\right) $
 * with a = 17.67, b = 243.5 C, c = 6.112 hPa.
 *
 * Within 0.2% of the ASHRAE values from -40 C to 50 C.
 *
 * \param temp temperature, C
 * \return saturation vapor pressure, hPa
 * \throw PsychroError Singularity at T = -243.5 C, and between about
 *        -249.72 C and the pole where the exponential overflows
 */
torch::Tensor saturation_vapor_pressure(torch::Tensor temp);

double saturation_vapor_pressure(double temp);

//! \brief Dew point from vapor pressure, the inverse of the Magnus formula
/*!
 * $ T_d = \frac{b \ln(e/c)}{a - \ln(e/c)} $
 *
 * \param pvap vapor pressure, hPa
 * \return dew point, C
 * \throw PsychroError Singularity at zero vapor pressure
 */
torch::Tensor dewpoint_from_vapor_pressure(torch::Tensor pvap);

double dewpoint_from_vapor_pressure(double pvap);

}  // namespace psychro
