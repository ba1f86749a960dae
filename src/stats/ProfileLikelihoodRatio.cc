#include "neymanplr/stats/ProfileLikelihoodRatio.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/core/Log.hh"
#include "neymanplr/model/LikelihoodModel.hh"

#include <iostream>
#include <mutex>
#include <utility>

namespace neymanplr::stats {

ProfileLikelihoodRatio::ProfileLikelihoodRatio(FitSettings fit, double negative_tolerance, int verbosity)
: profiler_(std::move(fit)), negative_tolerance_(negative_tolerance), verbosity_(verbosity) {}

StatisticResult ProfileLikelihoodRatio::Compute(const LikelihoodModel& model,
                                                const ParameterVector& theta_fixed,
                                                const ParameterVector& phi_guess) const {
  // fail fast before spending a fit
  const FitResult& global = model.GlobalFit();

  for (const auto& kv : theta_fixed)
    if (!model.ParamNeeded().count(kv.first))
      throw InvalidParameter(kv.first, Name(), "hypothesis fixes a parameter the model does not use");

  StatisticResult r;
  r.global_loglik = global.max_loglik;
  // no guess given: start the profile from the global best fit
  r.profiled = profiler_.Profile(model, theta_fixed, phi_guess.empty() ? global.params : phi_guess);

  // t = -2 ln [ L(theta, phi_hat_hat) / L(theta_hat, phi_hat) ]
  r.t = -2.0 * (r.profiled.max_loglik - global.max_loglik);

  if (r.t < -negative_tolerance_) {
    r.negative = true;
    std::lock_guard<std::mutex> lk(LogMutex());
    std::cerr << "[stats] WARNING: negative " << Name() << " t=" << r.t
              << " at " << ToString(theta_fixed)
              << ": profiled maximum lnL=" << r.profiled.max_loglik
              << " exceeds global maximum lnL=" << global.max_loglik
              << "; the global fit did not reach the maximum, refit with a better guess.\n";
  }

  if (verbosity_ > 1) {
    std::lock_guard<std::mutex> lk(LogMutex());
    std::cout << "[stats] " << Name() << " at " << ToString(theta_fixed) << ": t=" << r.t
              << " (profiled " << ToString(r.profiled.params) << ")\n";
  }
  return r;
}

OneSidedProfileLikelihoodRatio::OneSidedProfileLikelihoodRatio(std::string poi, FitSettings fit,
                                                               double negative_tolerance, int verbosity)
: ProfileLikelihoodRatio(std::move(fit), negative_tolerance, verbosity), poi_(std::move(poi)) {}

StatisticResult OneSidedProfileLikelihoodRatio::Compute(const LikelihoodModel& model,
                                                        const ParameterVector& theta_fixed,
                                                        const ParameterVector& phi_guess) const {
  const FitResult& global = model.GlobalFit();
  const double mu_test = RequireParameter(theta_fixed, poi_, Name());
  const double mu_hat  = RequireParameter(global.params, poi_, Name());

  if (mu_test < mu_hat) {
    StatisticResult r;
    r.t = 0.0;
    r.global_loglik = global.max_loglik;
    return r;
  }
  return ProfileLikelihoodRatio::Compute(model, theta_fixed, phi_guess);
}

} // namespace neymanplr::stats
