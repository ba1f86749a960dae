#pragma once

#include <string>

#include "neymanplr/core/FitResult.hh"
#include "neymanplr/core/Parameters.hh"

namespace neymanplr {
class LikelihoodModel;
}

namespace neymanplr::stats {

/// Value of a test statistic with the fits it was built from.
struct StatisticResult {
  double    t = 0.0;
  double    global_loglik = 0.0;
  FitResult profiled;
  bool      negative = false;   ///< t < -tolerance: profiled max above global max
};

/**
 * Abstract interface for likelihood-ratio test statistics evaluated at a
 * hypothesis point:
 *  - theta_fixed : values of the interesting parameters Θ (held fixed)
 *  - phi_guess   : starting point for the nuisance parameters Φ; when empty
 *                  the profile starts from the global best fit
 *
 * The model must carry a global fit for its current dataset
 * (LikelihoodModel::SetMaxLogLikelihood), otherwise StaleFitError.
 */
class ITestStatistic {
public:
  virtual ~ITestStatistic() = default;

  virtual std::string Name() const = 0;

  virtual StatisticResult Compute(const LikelihoodModel& model,
                                  const ParameterVector& theta_fixed,
                                  const ParameterVector& phi_guess) const = 0;

  /// Compute(...).t
  double Evaluate(const LikelihoodModel& model,
                  const ParameterVector& theta_fixed,
                  const ParameterVector& phi_guess) const {
    return Compute(model, theta_fixed, phi_guess).t;
  }
};

} // namespace neymanplr::stats
