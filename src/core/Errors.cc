#include "neymanplr/core/Errors.hh"

#include <sstream>
#include <utility>

namespace neymanplr {

MissingParameter::MissingParameter(std::string parameter, const std::string& context)
: Error("missing parameter '" + parameter + "'" +
        (context.empty() ? std::string{} : " (required by " + context + ")")),
  parameter_(std::move(parameter)) {}

InvalidParameter::InvalidParameter(std::string parameter, std::string term,
                                   const std::string& reason)
: Error("invalid parameter '" + parameter + "' in " + term + ": " + reason),
  parameter_(std::move(parameter)), term_(std::move(term)) {}

ConvergenceFailure::ConvergenceFailure(const std::string& what, FitResult best)
: Error(what), best_(std::move(best)) {}

static std::string stale_message(std::uint64_t data_gen,
                                 const std::optional<std::uint64_t>& fit_gen) {
  std::ostringstream os;
  os << "no valid global fit for dataset generation " << data_gen;
  if (fit_gen.has_value())
    os << " (cached fit belongs to generation " << *fit_gen << ")";
  else
    os << " (SetMaxLogLikelihood was never called)";
  return os.str();
}

StaleFitError::StaleFitError(std::uint64_t data_generation,
                             std::optional<std::uint64_t> fit_generation)
: Error(stale_message(data_generation, fit_generation)),
  data_generation_(data_generation), fit_generation_(fit_generation) {}

SimulationInconsistency::SimulationInconsistency(std::string component,
                                                 const std::string& detail)
: Error("simulation inconsistent with likelihood for '" + component + "': " + detail),
  component_(std::move(component)) {}

} // namespace neymanplr
