#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "neymanplr/core/FitResult.hh"

namespace neymanplr {

/// Base of every engine error.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A parameter required by some term is absent from the supplied vector.
class MissingParameter : public Error {
public:
  MissingParameter(std::string parameter, const std::string& context);
  const std::string& parameter() const noexcept { return parameter_; }

private:
  std::string parameter_;
};

/// A supplied value lies outside a term's domain, or the name is not a
/// parameter of the model at all.
class InvalidParameter : public Error {
public:
  InvalidParameter(std::string parameter, std::string term, const std::string& reason);
  const std::string& parameter() const noexcept { return parameter_; }
  const std::string& term() const noexcept { return term_; }

private:
  std::string parameter_;
  std::string term_;
};

/// The optimizer exhausted its budget or missed its tolerance. Carries the
/// best point found so that the caller can retry from a different guess.
class ConvergenceFailure : public Error {
public:
  ConvergenceFailure(const std::string& what, FitResult best);
  const FitResult& best() const noexcept { return best_; }

private:
  FitResult best_;
};

/// A statistic was requested without a global fit for the current dataset.
class StaleFitError : public Error {
public:
  StaleFitError(std::uint64_t data_generation, std::optional<std::uint64_t> fit_generation);
  std::uint64_t data_generation() const noexcept { return data_generation_; }
  const std::optional<std::uint64_t>& fit_generation() const noexcept { return fit_generation_; }

private:
  std::uint64_t                data_generation_;
  std::optional<std::uint64_t> fit_generation_;
};

/// Toy generation and likelihood evaluation disagree on the generative model.
/// This is a defect, not a recoverable condition.
class SimulationInconsistency : public Error {
public:
  SimulationInconsistency(std::string component, const std::string& detail);
  const std::string& component() const noexcept { return component_; }

private:
  std::string component_;
};

} // namespace neymanplr
