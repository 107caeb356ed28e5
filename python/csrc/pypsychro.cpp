// torch
#include <torch/extension.h>

// pybind11
#include <pybind11/stl.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/psychro.hpp>
#include <psychro/psychro_formatter.hpp>

// python
#include "pyoptions.hpp"

namespace py = pybind11;

namespace {

YAML::Node as_text(std::string const &str) {
  YAML::Node node(str);
  node.SetTag("!");  // same as a quoted scalar
  return node;
}

// python value as a loosely typed scalar, validated by compute
YAML::Node to_node(py::handle obj) {
  if (obj.is_none()) return YAML::Node();
  if (py::isinstance<py::bool_>(obj)) return YAML::Node(obj.cast<bool>());
  if (py::isinstance<py::str>(obj)) return as_text(obj.cast<std::string>());
  if (py::isinstance<py::sequence>(obj)) {
    return YAML::Node(YAML::NodeType::Sequence);
  }
  if (py::isinstance<py::dict>(obj)) return YAML::Node(YAML::NodeType::Map);

  try {
    return YAML::Node(obj.cast<double>());
  } catch (py::cast_error const &) {
    return as_text(py::str(obj));
  }
}

}  // namespace

void bind_psychro(py::module &m) {
  auto pyPsychroOptions =
      py::class_<psychro::PsychroOptions>(m, "PsychroOptions");

  pyPsychroOptions
      .def(py::init<>())

      .def("__repr__",
           [](const psychro::PsychroOptions &self) {
             return fmt::format("PsychroOptions{}", self);
           })

      .def("from_yaml", py::overload_cast<std::string const &>(
                            &psychro::PsychroOptions::from_yaml))

      .def("properties", &psychro::PsychroOptions::properties)

      .ADD_OPTION(double, psychro::PsychroOptions, pressure)

      .ADD_OPTION(int, psychro::PsychroOptions, decimals)

      .ADD_OPTION(double, psychro::PsychroOptions, Tmin)

      .ADD_OPTION(double, psychro::PsychroOptions, Tmax)

      .ADD_OPTION(int, psychro::PsychroOptions, RHmin)

      .ADD_OPTION(int, psychro::PsychroOptions, RHmax)

      .ADD_OPTION(std::string, psychro::PsychroOptions, method)

      .ADD_OPTION(bool, psychro::PsychroOptions, dewpoint)

      .ADD_OPTION(bool, psychro::PsychroOptions, wet_bulb)

      .ADD_OPTION(bool, psychro::PsychroOptions, enthalpy)

      .ADD_OPTION(bool, psychro::PsychroOptions, vapor_pressure)

      .ADD_OPTION(int, psychro::PsychroOptions, max_iter)

      .ADD_OPTION(double, psychro::PsychroOptions, ftol);

  py::class_<psychro::Property>(m, "Property")
      .def_readonly("name", &psychro::Property::name)
      .def_readonly("value", &psychro::Property::value)
      .def_readonly("unit", &psychro::Property::unit)
      .def("__repr__", [](const psychro::Property &self) {
        return fmt::format("Property({})", self);
      });

  py::class_<psychro::PsychroResult>(m, "PsychroResult")
      .def_readonly("temperature", &psychro::PsychroResult::temperature)
      .def_readonly("humidity", &psychro::PsychroResult::humidity)
      .def_readonly("properties", &psychro::PsychroResult::properties)
      .def_property_readonly("absolute_humidity",
                             &psychro::PsychroResult::absolute_humidity)
      .def_property_readonly("unit", &psychro::PsychroResult::unit)
      .def("get", &psychro::PsychroResult::get, py::arg("name"))
      .def("__repr__", [](const psychro::PsychroResult &self) {
        return fmt::format("PsychroResult{}", self);
      });

  ADD_PSYCHRO_MODULE(Psychrometrics, PsychroOptions, py::arg("temp"),
                     py::arg("rh"))

      .def(
          "compute",
          [](psychro::PsychrometricsImpl const &self, py::handle temp,
             py::handle rh) {
            return self.compute(to_node(temp), to_node(rh));
          },
          R"(
Compute moist-air properties of one sample.

Arguments that are not numbers (text, None, bool, containers) raise
PsychroError with kind InvalidType, infinite or NaN values NonFinite.
)",
          py::arg("temperature"), py::arg("humidity"))

      .def("info", [](psychro::PsychrometricsImpl const &self) {
        YAML::Emitter out;
        out << self.info();
        return std::string(out.c_str());
      });
}
