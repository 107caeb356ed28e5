#pragma once

// getter and chainable setter of an ADD_ARG field
#define ADD_OPTION(T, st_name, op_name)                                     \
  def(#op_name, (T const &(st_name::*)() const) & st_name::op_name,         \
      py::return_value_policy::reference)                                   \
      .def(#op_name, (st_name & (st_name::*)(const T &)) & st_name::op_name, \
           py::return_value_policy::reference)

// torch module bound with its options; __repr__ needs psychro_formatter.hpp
#define ADD_PSYCHRO_MODULE(m_name, op_name, ...)                          \
  torch::python::bind_module<psychro::m_name##Impl>(m, #m_name)           \
      .def(py::init<>(), "Construct a " #m_name " with default options")  \
      .def(py::init<psychro::op_name>(), "Construct a " #m_name,          \
           py::arg("options"))                                            \
      .def_readonly("options", &psychro::m_name##Impl::options)           \
      .def("__repr__",                                                    \
           [](const psychro::m_name##Impl &self) {                        \
             return fmt::format(#m_name "{}", self.options);              \
           })                                                             \
      .def("forward", &psychro::m_name##Impl::forward, __VA_ARGS__)
