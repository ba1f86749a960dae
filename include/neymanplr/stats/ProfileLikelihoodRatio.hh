#pragma once

#include <string>

#include "neymanplr/fit/Profiler.hh"
#include "neymanplr/stats/ITestStatistic.hh"

namespace neymanplr::stats {

/**
 * Profile-likelihood-ratio statistic:
 *
 *   t(theta) = -2 [ ln L(theta, phi_hat_hat(theta)) - ln L(theta_hat, phi_hat) ]
 *
 * The denominator is the model's cached global fit; the numerator is a
 * profiled fit with Θ fixed. t >= 0 when both fits reach their optimum.
 * A negative t means the global fit missed the maximum; it is returned
 * unchanged and reported on stderr, never clipped to zero.
 */
class ProfileLikelihoodRatio : public ITestStatistic {
public:
  ProfileLikelihoodRatio(FitSettings fit, double negative_tolerance = 1e-3, int verbosity = 0);
  ~ProfileLikelihoodRatio() override = default;

  std::string Name() const override { return "PLR"; }

  StatisticResult Compute(const LikelihoodModel& model,
                          const ParameterVector& theta_fixed,
                          const ParameterVector& phi_guess) const override;

protected:
  Profiler profiler_;
  double   negative_tolerance_;
  int      verbosity_;
};

/**
 * One-sided variant for upper limits on a parameter of interest `poi`:
 * t = 0 when the fixed poi value lies below its global best-fit value,
 * so that upward fluctuations do not count against the hypothesis.
 */
class OneSidedProfileLikelihoodRatio : public ProfileLikelihoodRatio {
public:
  OneSidedProfileLikelihoodRatio(std::string poi, FitSettings fit,
                                 double negative_tolerance = 1e-3, int verbosity = 0);

  std::string Name() const override { return "PLR_ONESIDED"; }

  StatisticResult Compute(const LikelihoodModel& model,
                          const ParameterVector& theta_fixed,
                          const ParameterVector& phi_guess) const override;

  const std::string& poi() const noexcept { return poi_; }

private:
  std::string poi_;
};

} // namespace neymanplr::stats
