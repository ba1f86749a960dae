#pragma once
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

#include "neymanplr/core/Parameters.hh"

namespace neymanplr {

/// Outcome of one (global or profiled) maximization of the log-likelihood.
struct FitResult {
  ParameterVector params;            ///< best point (fixed parameters included)
  ParameterVector errors;            ///< Hesse errors of free parameters, if computed
  double          max_loglik = std::numeric_limits<double>::quiet_NaN();

  bool            converged = false;
  int             status    = -1;    ///< minimizer status code (0 = ok)
  unsigned int    n_calls   = 0;     ///< likelihood evaluations used
  unsigned int    n_rejected = 0;    ///< evaluations outside a term's domain
  double          edm = std::numeric_limits<double>::quiet_NaN();

  std::set<std::string> fixed;       ///< parameters held constant during the fit

  // Curvature diagnostics (global fits only)
  bool                     hesse_failed = false;   ///< curvature could not be computed
  bool                     flat_likelihood = false;
  std::vector<std::string> flat_parameters;
  std::vector<std::string> at_bound;               ///< best value on a box bound, not checked for flatness

  std::uint64_t   data_generation = 0;  ///< dataset generation the fit was run on
};

} // namespace neymanplr
