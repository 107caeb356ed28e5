// C/C++
#include <cmath>

// fmt
#include <fmt/format.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/errors.hpp>

#include "validate.hpp"

namespace psychro {

namespace {

double as_number(YAML::Node const& node, char const* name) {
  if (!node.IsDefined() || node.IsNull()) {
    throw PsychroError(ErrorKind::InvalidType,
                       fmt::format("{} is missing or null", name));
  }

  if (!node.IsScalar()) {
    throw PsychroError(
        ErrorKind::InvalidType,
        fmt::format("{} must be a number, got a {}", name,
                    node.IsSequence() ? "sequence" : "mapping"));
  }

  // quoted scalars are text even when they look like numbers
  if (node.Tag() == "!") {
    throw PsychroError(
        ErrorKind::InvalidType,
        fmt::format("{} must be a number, got text '{}'", name, node.Scalar()));
  }

  double value;
  if (!YAML::convert<double>::decode(node, value)) {
    throw PsychroError(
        ErrorKind::InvalidType,
        fmt::format("{} must be a number, got '{}'", name, node.Scalar()));
  }
  return value;
}

bool is_real(torch::Tensor const& t) {
  return t.is_floating_point() ||
         c10::isIntegralType(t.scalar_type(), /*includeBool=*/false);
}

double first_of(torch::Tensor const& t, torch::Tensor const& mask) {
  return t.masked_select(mask)[0].item<double>();
}

}  // namespace

double validate_temperature(double value, PsychroOptions const& op) {
  if (!std::isfinite(value)) {
    throw PsychroError(ErrorKind::NonFinite,
                       fmt::format("temperature {} is not finite", value));
  }

  if (value < op.Tmin() || value > op.Tmax()) {
    throw PsychroError(
        ErrorKind::OutOfRange,
        fmt::format("temperature {} C is outside [{}, {}]", value, op.Tmin(),
                    op.Tmax()));
  }

  return value;
}

double validate_temperature(YAML::Node const& node, PsychroOptions const& op) {
  return validate_temperature(as_number(node, "temperature"), op);
}

int validate_humidity(double value, PsychroOptions const& op) {
  if (!std::isfinite(value)) {
    throw PsychroError(ErrorKind::NonFinite,
                       fmt::format("humidity {} is not finite", value));
  }

  if (value < op.RHmin() || value > op.RHmax()) {
    throw PsychroError(ErrorKind::OutOfRange,
                       fmt::format("humidity {} % is outside [{}, {}]", value,
                                   op.RHmin(), op.RHmax()));
  }

  return static_cast<int>(value);
}

int validate_humidity(YAML::Node const& node, PsychroOptions const& op) {
  return validate_humidity(as_number(node, "humidity"), op);
}

torch::Tensor check_temperature(torch::Tensor temp, PsychroOptions const& op) {
  if (!is_real(temp)) {
    throw PsychroError(
        ErrorKind::InvalidType,
        fmt::format("temperature tensor must be real, got {}",
                    c10::toString(temp.scalar_type())));
  }

  temp = temp.to(torch::kFloat64);

  auto bad = torch::isfinite(temp).logical_not();
  if (bad.any().item<bool>()) {
    throw PsychroError(ErrorKind::NonFinite,
                       fmt::format("temperature {} is not finite",
                                   first_of(temp, bad)));
  }

  bad = (temp < op.Tmin()).logical_or(temp > op.Tmax());
  if (bad.any().item<bool>()) {
    throw PsychroError(ErrorKind::OutOfRange,
                       fmt::format("temperature {} C is outside [{}, {}]",
                                   first_of(temp, bad), op.Tmin(), op.Tmax()));
  }

  return temp;
}

torch::Tensor check_humidity(torch::Tensor rh, PsychroOptions const& op) {
  if (!is_real(rh)) {
    throw PsychroError(ErrorKind::InvalidType,
                       fmt::format("humidity tensor must be real, got {}",
                                   c10::toString(rh.scalar_type())));
  }

  rh = rh.to(torch::kFloat64);

  auto bad = torch::isfinite(rh).logical_not();
  if (bad.any().item<bool>()) {
    throw PsychroError(
        ErrorKind::NonFinite,
        fmt::format("humidity {} is not finite", first_of(rh, bad)));
  }

  bad = (rh < op.RHmin()).logical_or(rh > op.RHmax());
  if (bad.any().item<bool>()) {
    throw PsychroError(ErrorKind::OutOfRange,
                       fmt::format("humidity {} % is outside [{}, {}]",
                                   first_of(rh, bad), op.RHmin(), op.RHmax()));
  }

  return rh.trunc();
}

}  // namespace psychro
