#pragma once

// torch
#include <torch/torch.h>

namespace psychro {

//! \brief Actual vapor pressure from temperature and relative humidity
/*!
 * \param temp temperature, C
 * \param rh relative humidity, %
 * \return vapor pressure, hPa, exactly zero where rh is zero
 */
torch::Tensor vapor_pressure(torch::Tensor temp, torch::Tensor rh);

//! \brief Absolute humidity, direct vapor-pressure form
/*!
 * $ \rho_v = \frac{e M_w}{R T_K} $
 * with M_w = 18.016 g/mol and R = 8314.5 J/(kmol K).
 *
 * \param temp temperature, C
 * \param pvap vapor pressure, Pa
 * \return absolute humidity, g/m^3
 * \throw PsychroError Singularity at T = -273.15 C unless pvap is zero
 */
torch::Tensor absolute_humidity(torch::Tensor temp, torch::Tensor pvap);

//! \brief Absolute humidity, humidity-ratio form
/*!
 * Water mass per unit mass of dry air times the dry-air density,
 * $ \rho_v = w \frac{P - e}{R_d T_K} $.
 * Agrees with the direct form to within 0.01 g/m^3 in the typical range.
 *
 * \param temp temperature, C
 * \param pvap vapor pressure, Pa
 * \param pres total pressure, Pa
 * \return absolute humidity, g/m^3
 */
torch::Tensor absolute_humidity_from_hum_ratio(torch::Tensor temp,
                                               torch::Tensor pvap,
                                               torch::Tensor pres);

//! \brief Absolute humidity [g/m^3], rounded to 2 decimals
double absolute_humidity(double temp, int rh);

//! \brief Humidity ratio (kg water / kg dry air)
/*!
 * $ w = 0.622 \frac{e}{P - e} $
 *
 * \param pvap vapor pressure, Pa
 * \param pres total pressure, Pa
 * \throw PsychroError OutOfRange if e >= P
 */
torch::Tensor humidity_ratio(torch::Tensor pvap, torch::Tensor pres);

//! \brief Moist air enthalpy [kJ/kg dry air]
/*!
 * $ h = 1.006 T + w (2501 + 1.86 T) $
 */
torch::Tensor moist_air_enthalpy(torch::Tensor temp, torch::Tensor hum_ratio);

}  // namespace psychro
