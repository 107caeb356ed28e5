// external
#include <gtest/gtest.h>

// torch
#include <torch/torch.h>

// psychro
#include <psychro/constants.h>
#include <psychro/thermo/moist_air.hpp>
#include <psychro/thermo/svp.hpp>
#include <psychro/thermo/wet_bulb.hpp>

// tests
#include "device_testing.hpp"
#include "expect_error.hpp"

using namespace psychro;

TEST_P(DeviceTest, wet_bulb_values) {
  auto opts = torch::device(device).dtype(dtype);
  auto temp = torch::tensor({25., 20., 30., -10., 25.}, opts);
  auto rh = torch::tensor({50., 50., 80., 60., 0.}, opts);
  auto pres = torch::tensor(constants::Pstd, opts);

  auto pvap = 100. * vapor_pressure(temp, rh);
  auto twb = wet_bulb_temperature(temp, pvap, pres, 100, 1.e-3).cpu();

  EXPECT_NEAR(twb[0].item<double>(), 17.893, 2.e-3);
  EXPECT_NEAR(twb[1].item<double>(), 13.785, 2.e-3);
  EXPECT_NEAR(twb[2].item<double>(), 27.095, 2.e-3);
  EXPECT_NEAR(twb[3].item<double>(), -11.447, 2.e-3);
  EXPECT_NEAR(twb[4].item<double>(), 8.275, 2.e-3);
}

TEST_P(DeviceTest, wet_bulb_saturated) {
  auto opts = torch::device(device).dtype(dtype);
  auto temp = torch::tensor({-5., 10., 40.}, opts);
  auto pres = torch::tensor(constants::Pstd, opts);

  auto pvap = 100. * vapor_pressure(temp, torch::full_like(temp, 100.));
  auto twb = wet_bulb_temperature(temp, pvap, pres, 100, 1.e-3);
  EXPECT_TRUE(torch::allclose(twb, temp, /*rtol=*/0., /*atol=*/1.e-3));
}

TEST_P(DeviceTest, wet_bulb_bracketed) {
  auto opts = torch::device(device).dtype(dtype);
  auto temp = torch::linspace(-30., 50., 17, opts);
  auto pres = torch::tensor(constants::Pstd, opts);

  auto pvap = 100. * vapor_pressure(temp, torch::full_like(temp, 40.));
  auto twb = wet_bulb_temperature(temp, pvap, pres, 100, 1.e-3);

  EXPECT_TRUE((twb <= temp).all().item<bool>());
  EXPECT_TRUE((twb.diff() > 0.).all().item<bool>());
}

TEST_P(DeviceTest, wet_bulb_iteration_budget) {
  auto opts = torch::device(device).dtype(dtype);
  auto temp = torch::tensor({25.}, opts);
  auto pres = torch::tensor(constants::Pstd, opts);
  auto pvap = 100. * vapor_pressure(temp, torch::tensor({50.}, opts));

  EXPECT_EQ(error_kind([&] {
              wet_bulb_temperature(temp, pvap, pres, /*max_iter=*/3, 1.e-3);
            }),
            ErrorKind::ConvergenceFailure);
}

TEST(wet_bulb, hum_ratio_round_trip) {
  auto temp = torch::tensor(25., torch::kFloat64);
  auto pres = torch::tensor(constants::Pstd, torch::kFloat64);
  auto pvap = 100. * vapor_pressure(temp, torch::tensor(50., torch::kFloat64));

  auto w = humidity_ratio(pvap, pres);
  auto twb = wet_bulb_temperature(temp, pvap, pres, 100, 1.e-6);
  auto w2 = hum_ratio_from_wet_bulb(temp, twb, pres);

  EXPECT_NEAR(w2.item<double>(), w.item<double>(), 1.e-8);
}

TEST_P(DeviceTest, saturated_air_equation) {
  // at Twb = T both branches reduce to the saturation humidity ratio
  auto opts = torch::device(device).dtype(dtype);
  auto temp = torch::tensor({-30., -5., 0., 15., 40.}, opts);
  auto pres = torch::tensor(constants::Pstd, opts);

  auto ws = humidity_ratio(100. * saturation_vapor_pressure(temp), pres);
  auto w = hum_ratio_from_wet_bulb(temp, temp, pres);

  EXPECT_TRUE(torch::allclose(w, ws, /*rtol=*/1.e-12, /*atol=*/0.));
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
