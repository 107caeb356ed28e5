// C/C++
#include <sstream>

// external
#include <gtest/gtest.h>

// torch
#include <torch/torch.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/psychro.hpp>
#include <psychro/psychro_formatter.hpp>

// tests
#include "expect_error.hpp"

using namespace psychro;

TEST(options, defaults) {
  PsychroOptions op;

  EXPECT_DOUBLE_EQ(op.pressure(), 101325.);
  EXPECT_EQ(op.decimals(), 2);
  EXPECT_DOUBLE_EQ(op.Tmin(), -273.15);
  EXPECT_DOUBLE_EQ(op.Tmax(), 1000.);
  EXPECT_EQ(op.RHmin(), 0);
  EXPECT_EQ(op.RHmax(), 100);
  EXPECT_EQ(op.method(), "vapor-pressure");
  EXPECT_EQ(op.properties(), std::vector<std::string>{"absolute_humidity"});
}

TEST(options, from_yaml_file) {
  auto op = PsychroOptions::from_yaml("psychro.yaml");

  EXPECT_DOUBLE_EQ(op.pressure(), 90000.);
  EXPECT_EQ(op.method(), "humidity-ratio");
  EXPECT_DOUBLE_EQ(op.Tmin(), -60.);
  EXPECT_DOUBLE_EQ(op.Tmax(), 60.);
  EXPECT_EQ(op.RHmin(), 5);
  EXPECT_EQ(op.RHmax(), 95);
  EXPECT_EQ(op.decimals(), 3);
  EXPECT_EQ(op.max_iter(), 80);
  EXPECT_DOUBLE_EQ(op.ftol(), 1.e-4);

  std::vector<std::string> expected = {
      "absolute_humidity", "dewpoint", "wet_bulb", "enthalpy",
      "saturation_vapor_pressure", "vapor_pressure"};
  EXPECT_EQ(op.properties(), expected);

  std::cout << fmt::format("{}", op) << std::endl;
}

TEST(options, from_yaml_partial) {
  auto op = PsychroOptions::from_yaml(YAML::Load(R"(
output:
  properties: [enthalpy]
)"));

  EXPECT_DOUBLE_EQ(op.pressure(), 101325.);
  EXPECT_EQ(op.decimals(), 2);
  EXPECT_FALSE(op.dewpoint());
  EXPECT_TRUE(op.enthalpy());
}

TEST(options, unknown_property) {
  auto config = YAML::Load("output: {properties: [dew-point]}");
  EXPECT_THROW(PsychroOptions::from_yaml(config), c10::Error);
  EXPECT_THROW(property_unit("relative_humidity"), c10::Error);
}

TEST(options, configured_engine) {
  Psychrometrics engine(PsychroOptions::from_yaml("psychro.yaml"));

  // the narrower limits apply
  EXPECT_EQ(error_kind([&] { engine->compute(70., 50); }),
            ErrorKind::OutOfRange);
  EXPECT_EQ(error_kind([&] { engine->compute(20., 99); }),
            ErrorKind::OutOfRange);

  auto result = engine->compute(20., 50);
  ASSERT_EQ(result.properties.size(), 6);
  EXPECT_NEAR(result.absolute_humidity(), 8.637, 1.e-3);

  // lower pressure raises the humidity ratio and the enthalpy with it
  Psychrometrics standard(PsychroOptions().enthalpy(true));
  EXPECT_GT(*result.get("enthalpy"),
            *standard->compute(20., 50).get("enthalpy"));
}

TEST(options, pretty_print) {
  Psychrometrics engine;
  std::ostringstream ss;
  engine->pretty_print(ss);
  EXPECT_NE(ss.str().find("method = vapor-pressure"), std::string::npos);
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
