#pragma once

namespace psychro {
namespace constants {

// Magnus coefficients, es = c * exp(a * T / (T + b)) [hPa]
double constexpr Magnus_a = 17.67;
double constexpr Magnus_b = 243.5;  // C
double constexpr Magnus_c = 6.112;  // hPa

double constexpr Mw = 18.016;     // g/mol, molecular weight of water
double constexpr Rgas = 8314.5;   // J/(kmol*K), universal gas constant
double constexpr Rd = 287.042;    // J/(kg*K), dry air
double constexpr eps = 0.622;     // Mw / Md
double constexpr Pstd = 101325.;  // Pa, standard atmosphere
double constexpr T0 = 273.15;     // K, 0 C

double constexpr cp_dry = 1.006;    // kJ/(kg*K)
double constexpr cp_vapor = 1.86;   // kJ/(kg*K)
double constexpr cp_water = 4.186;  // kJ/(kg*K), liquid water
double constexpr cp_ice = 2.1;      // kJ/(kg*K)
double constexpr Lv0 = 2501.;       // kJ/kg, latent heat of vaporization at 0 C
double constexpr Ls0 = 2830.;       // kJ/kg, latent heat of sublimation at 0 C

// lowest humidity ratio the wet-bulb solver works with
double constexpr min_hum_ratio = 1.e-7;

}  // namespace constants
}  // namespace psychro
