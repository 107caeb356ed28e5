// pybind11
#include <pybind11/pybind11.h>

// torch
#include <torch/extension.h>

// psychro
#include <psychro/errors.hpp>

namespace py = pybind11;

void bind_psychro(py::module &m);

PYBIND11_MODULE(pypsychro, m) {
  m.attr("__name__") = "pypsychro";
  m.doc() = R"(Moist-air psychrometric property engine)";

  py::enum_<psychro::ErrorKind>(m, "ErrorKind")
      .value("InvalidType", psychro::ErrorKind::InvalidType)
      .value("NonFinite", psychro::ErrorKind::NonFinite)
      .value("OutOfRange", psychro::ErrorKind::OutOfRange)
      .value("Singularity", psychro::ErrorKind::Singularity)
      .value("ConvergenceFailure", psychro::ErrorKind::ConvergenceFailure)
      .value("CalculationError", psychro::ErrorKind::CalculationError);

  m.def("is_client_fault", &psychro::is_client_fault);

  // the error kind travels as the second exception argument
  static py::exception<psychro::PsychroError> exc(m, "PsychroError",
                                                  PyExc_ValueError);
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (psychro::PsychroError const &e) {
      py::object kind = py::cast(e.kind());
      PyErr_SetObject(exc.ptr(),
                      py::make_tuple(e.what(), kind).ptr());
    }
  });

  bind_psychro(m);
}
