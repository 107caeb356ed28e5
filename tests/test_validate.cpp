// C/C++
#include <cmath>
#include <limits>

// external
#include <gtest/gtest.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/validate/validate.hpp>

// tests
#include "expect_error.hpp"

using namespace psychro;

TEST(validate, temperature_bounds) {
  EXPECT_DOUBLE_EQ(validate_temperature(-273.15), -273.15);
  EXPECT_DOUBLE_EQ(validate_temperature(1000.), 1000.);
  EXPECT_DOUBLE_EQ(validate_temperature(21.37), 21.37);

  EXPECT_EQ(error_kind([] { validate_temperature(-273.16); }),
            ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([] { validate_temperature(1000.01); }),
            ErrorKind::OutOfRange);
}

TEST(validate, temperature_non_finite) {
  auto inf = std::numeric_limits<double>::infinity();
  auto nan = std::numeric_limits<double>::quiet_NaN();

  EXPECT_EQ(error_kind([&] { validate_temperature(inf); }),
            ErrorKind::NonFinite);
  EXPECT_EQ(error_kind([&] { validate_temperature(-inf); }),
            ErrorKind::NonFinite);
  EXPECT_EQ(error_kind([&] { validate_temperature(nan); }),
            ErrorKind::NonFinite);
}

TEST(validate, humidity_truncates) {
  EXPECT_EQ(validate_humidity(55.9), 55);
  EXPECT_EQ(validate_humidity(0.5), 0);
  EXPECT_EQ(validate_humidity(99.99), 99);
  EXPECT_EQ(validate_humidity(100.), 100);
  EXPECT_EQ(validate_humidity(0.), 0);
}

TEST(validate, humidity_bounds) {
  EXPECT_EQ(error_kind([] { validate_humidity(100.5); }),
            ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([] { validate_humidity(-0.5); }), ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([] { validate_humidity(101.); }), ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([] {
              validate_humidity(std::numeric_limits<double>::quiet_NaN());
            }),
            ErrorKind::NonFinite);
}

TEST(validate, custom_limits) {
  auto op = PsychroOptions().Tmin(-40.).Tmax(50.).RHmin(10).RHmax(90);

  EXPECT_DOUBLE_EQ(validate_temperature(-40., op), -40.);
  EXPECT_EQ(error_kind([&] { validate_temperature(-41., op); }),
            ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([&] { validate_humidity(95., op); }),
            ErrorKind::OutOfRange);
  EXPECT_EQ(validate_humidity(90., op), 90);
}

TEST(validate, yaml_numbers) {
  EXPECT_DOUBLE_EQ(validate_temperature(YAML::Load("20.5")), 20.5);
  EXPECT_DOUBLE_EQ(validate_temperature(YAML::Load("-5")), -5.);
  EXPECT_DOUBLE_EQ(validate_temperature(YAML::Load("1e2")), 100.);
  EXPECT_EQ(validate_humidity(YAML::Load("55.9")), 55);
  EXPECT_EQ(validate_humidity(YAML::Load("60")), 60);
}

TEST(validate, yaml_invalid_type) {
  for (auto text : {"abc", "~", "[1, 2]", "{a: 1}", "'20'", "true"}) {
    auto node = YAML::Load(text);
    EXPECT_EQ(error_kind([&] { validate_temperature(node); }),
              ErrorKind::InvalidType)
        << text;
    EXPECT_EQ(error_kind([&] { validate_humidity(node); }),
              ErrorKind::InvalidType)
        << text;
  }

  auto missing = YAML::Load("{humidity: 50}");
  EXPECT_EQ(error_kind([&] { validate_temperature(missing["temperature"]); }),
            ErrorKind::InvalidType);
}

TEST(validate, yaml_non_finite) {
  for (auto text : {".inf", "-.inf", ".nan"}) {
    auto node = YAML::Load(text);
    EXPECT_EQ(error_kind([&] { validate_temperature(node); }),
              ErrorKind::NonFinite)
        << text;
  }
}

TEST(validate, tensors) {
  PsychroOptions op;

  auto temp = check_temperature(torch::tensor({20, 30}, torch::kInt32), op);
  EXPECT_EQ(temp.scalar_type(), torch::kFloat64);

  auto rh = check_humidity(torch::tensor({55.9, 0.5, 100.}), op);
  EXPECT_TRUE(torch::equal(rh, torch::tensor({55., 0., 100.}, torch::kFloat64)));

  EXPECT_EQ(error_kind([&] { check_temperature(torch::tensor({true}), op); }),
            ErrorKind::InvalidType);
  EXPECT_EQ(error_kind([&] {
              check_temperature(torch::tensor({20., std::nan("")}), op);
            }),
            ErrorKind::NonFinite);
  EXPECT_EQ(
      error_kind([&] { check_temperature(torch::tensor({20., -300.}), op); }),
      ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([&] { check_humidity(torch::tensor({50., 120.}), op); }),
            ErrorKind::OutOfRange);
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
