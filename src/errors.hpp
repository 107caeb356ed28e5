#pragma once

// C/C++
#include <stdexcept>
#include <string>

namespace psychro {

//! Kind of failure of a single psychrometric call
enum class ErrorKind {
  InvalidType,         //!< input is not numeric
  NonFinite,           //!< input is infinite or NaN
  OutOfRange,          //!< numeric but outside the accepted domain
  Singularity,         //!< known undefined point of a formula
  ConvergenceFailure,  //!< iterative solver ran out of iterations
  CalculationError     //!< any other arithmetic failure
};

std::string to_string(ErrorKind kind);

//! true for faults caused by the caller's input
bool is_client_fault(ErrorKind kind);

class PsychroError : public std::runtime_error {
 public:
  PsychroError(ErrorKind kind, std::string const& msg)
      : std::runtime_error(msg), _kind(kind) {}

  ErrorKind kind() const noexcept { return _kind; }

 private:
  ErrorKind _kind;
};

}  // namespace psychro
