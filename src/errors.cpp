// psychro
#include "errors.hpp"

namespace psychro {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidType:
      return "InvalidType";
    case ErrorKind::NonFinite:
      return "NonFinite";
    case ErrorKind::OutOfRange:
      return "OutOfRange";
    case ErrorKind::Singularity:
      return "SingularityError";
    case ErrorKind::ConvergenceFailure:
      return "ConvergenceFailure";
    case ErrorKind::CalculationError:
      return "CalculationError";
  }
  return "CalculationError";
}

bool is_client_fault(ErrorKind kind) {
  return kind == ErrorKind::InvalidType || kind == ErrorKind::NonFinite ||
         kind == ErrorKind::OutOfRange;
}

}  // namespace psychro
