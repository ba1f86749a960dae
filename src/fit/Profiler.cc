#include "neymanplr/fit/Profiler.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/core/Log.hh"
#include "neymanplr/model/LikelihoodModel.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

// ROOT Minimizer
#include "Math/Factory.h"
#include "Math/Functor.h"
#include "Math/Minimizer.h"

namespace neymanplr {

namespace {

// returned for points a term rejects; large enough that Migrad backs off
constexpr double kPenalty = 1e100;

double initial_step(const ParameterSpec& spec, double start) {
  double step = (std::abs(start) > 0.0) ? 0.1 * std::abs(start) : 0.1;
  if (spec.has_lower() && spec.has_upper())
    step = std::min(step, 0.1 * (spec.upper - spec.lower));
  return (step > 0.0) ? step : 0.1;
}

// Minuit's limit transform leaves a bounded best fit within a small
// distance of the wall; there the external variance is not a curvature.
bool at_bound(const ParameterSpec& spec, double x) {
  const double width = (spec.has_lower() && spec.has_upper()) ? spec.upper - spec.lower : 1.0;
  if (spec.has_lower() && x - spec.lower <= 1e-4 * std::max(width, std::abs(spec.lower))) return true;
  if (spec.has_upper() && spec.upper - x <= 1e-4 * std::max(width, std::abs(spec.upper))) return true;
  return false;
}

} // namespace

Profiler::Profiler(FitSettings settings) : settings_(std::move(settings)) {
  if (settings_.max_function_calls <= 0)
    throw std::invalid_argument("fit.max_function_calls must be > 0");
  if (!(settings_.tolerance > 0.0))
    throw std::invalid_argument("fit.tolerance must be > 0");
}

FitResult Profiler::MaximizeGlobal(const LikelihoodModel& model, const ParameterVector& guess) const {
  return Maximize(model, guess, {});
}

FitResult Profiler::Profile(const LikelihoodModel& model,
                            const ParameterVector& theta_fixed,
                            const ParameterVector& phi_guess) const {
  // fixed values take precedence over a guess for the same name
  ParameterVector start = phi_guess;
  std::set<std::string> fixed;
  for (const auto& [name, value] : theta_fixed) {
    start[name] = value;
    fixed.insert(name);
  }
  return Maximize(model, start, fixed);
}

FitResult Profiler::Maximize(const LikelihoodModel& model,
                             const ParameterVector& guess,
                             const std::set<std::string>& fixed) const {
  const auto& needed = model.ParamNeeded();
  const auto& reg    = model.parameters();

  for (const auto& kv : guess)
    if (!needed.count(kv.first))
      throw InvalidParameter(kv.first, "fit guess", "not a parameter of the model");
  for (const auto& f : fixed)
    if (!needed.count(f))
      throw InvalidParameter(f, "fit", "cannot fix a parameter the model does not use");

  const std::vector<std::string> names(needed.begin(), needed.end());
  const std::size_t npar = names.size();

  std::vector<double> start(npar);
  for (std::size_t i = 0; i < npar; ++i) {
    start[i] = RequireParameter(guess, names[i], "fit guess");
    const auto& spec = reg.Get(names[i]);
    if (!std::isfinite(start[i]) || !spec.contains(start[i])) {
      std::ostringstream os;
      os << "start value " << start[i] << " outside [" << spec.lower << ", " << spec.upper << "]";
      throw InvalidParameter(names[i], "fit guess", os.str());
    }
  }

  FitResult out;
  out.fixed = fixed;
  out.data_generation = model.data_generation();

  unsigned int n_calls = 0;
  unsigned int n_rejected = 0;
  ParameterVector work = guess;

  auto nll = [&](const double* x) -> double {
    ++n_calls;
    for (std::size_t i = 0; i < npar; ++i) work[names[i]] = x[i];
    try {
      const double ll = model.Evaluate(work);
      if (!std::isfinite(ll)) { ++n_rejected; return kPenalty; }
      return -ll;
    } catch (const InvalidParameter& e) {
      ++n_rejected;
      if (settings_.verbosity > 2) {
        std::lock_guard<std::mutex> lk(LogMutex());
        std::cerr << "[fit] rejected point: " << e.what() << "\n";
      }
      return kPenalty;
    }
  };

  const std::size_t nfree = npar - fixed.size();
  if (nfree == 0) {
    // nothing to optimize: the constrained maximum is the point itself
    out.params = guess;
    out.max_loglik = model.Evaluate(guess);
    out.n_calls = 1;
    out.converged = std::isfinite(out.max_loglik);
    out.status = out.converged ? 0 : 5;
    if (!out.converged)
      throw ConvergenceFailure("[fit] log-likelihood not finite at fixed point " + ToString(guess), out);
    return out;
  }

  std::unique_ptr<ROOT::Math::Minimizer> min(
    ROOT::Math::Factory::CreateMinimizer(settings_.minimizer, settings_.algorithm)
  );
  if (!min)
    throw std::runtime_error("cannot create minimizer " + settings_.minimizer + "/" + settings_.algorithm);

  min->SetMaxFunctionCalls(static_cast<unsigned int>(settings_.max_function_calls));
  min->SetMaxIterations(static_cast<unsigned int>(settings_.max_iterations));
  min->SetTolerance(settings_.tolerance);
  min->SetStrategy(settings_.strategy);
  min->SetPrintLevel(settings_.print_level);
  min->SetErrorDef(0.5);   // -ln L

  ROOT::Math::Functor functor(nll, static_cast<unsigned int>(npar));
  min->SetFunction(functor);

  for (std::size_t i = 0; i < npar; ++i) {
    const auto ui = static_cast<unsigned int>(i);
    const auto& spec = reg.Get(names[i]);
    const double step = initial_step(spec, start[i]);

    if (fixed.count(names[i]))                   min->SetFixedVariable(ui, names[i], start[i]);
    else if (spec.has_lower() && spec.has_upper()) min->SetLimitedVariable(ui, names[i], start[i], step, spec.lower, spec.upper);
    else if (spec.has_lower())                   min->SetLowerLimitedVariable(ui, names[i], start[i], step, spec.lower);
    else if (spec.has_upper())                   min->SetUpperLimitedVariable(ui, names[i], start[i], step, spec.upper);
    else                                         min->SetVariable(ui, names[i], start[i], step);
  }

  const bool ok = min->Minimize();

  const double* xs = min->X();
  out.params = guess;
  for (std::size_t i = 0; i < npar; ++i) out.params[names[i]] = xs[i];
  out.max_loglik = -min->MinValue();
  out.status     = min->Status();
  out.edm        = min->Edm();
  out.n_calls    = n_calls;
  out.n_rejected = n_rejected;
  out.converged  = ok && min->MinValue() < 0.5 * kPenalty;

  if (settings_.verbosity > 1) {
    std::lock_guard<std::mutex> lk(LogMutex());
    std::cout << "[fit] " << (fixed.empty() ? "global" : "profiled") << " fit: status=" << out.status
              << " calls=" << n_calls << " lnL=" << out.max_loglik
              << " at " << ToString(out.params) << "\n";
  }

  if (!out.converged) {
    std::ostringstream os;
    os << "[fit] minimizer did not converge (status " << out.status << ", " << n_calls
       << " of " << settings_.max_function_calls << " calls, edm " << out.edm
       << "); best lnL " << out.max_loglik << " at " << ToString(out.params);
    throw ConvergenceFailure(os.str(), out);
  }

  // Curvature along each free direction of a global fit
  if (fixed.empty() && settings_.compute_curvature) {
    if (!min->Hesse()) {
      out.hesse_failed = true;
      std::lock_guard<std::mutex> lk(LogMutex());
      std::cerr << "[fit] WARNING: Hesse failed at the global maximum " << ToString(out.params)
                << " (status " << min->Status() << "); curvature not checked.\n";
      return out;
    }
    for (std::size_t i = 0; i < npar; ++i) {
      const auto ui = static_cast<unsigned int>(i);
      const double cov = min->CovMatrix(ui, ui);
      if (cov > 0.0 && std::isfinite(cov)) out.errors[names[i]] = std::sqrt(cov);
      if (at_bound(reg.Get(names[i]), out.params.at(names[i]))) {
        out.at_bound.push_back(names[i]);
        continue;
      }
      const double curvature = (cov > 0.0 && std::isfinite(cov)) ? 1.0 / cov : 0.0;
      if (curvature < settings_.flat_curvature_threshold) {
        out.flat_likelihood = true;
        out.flat_parameters.push_back(names[i]);
      }
    }
    if (out.flat_likelihood) {
      std::ostringstream os;
      os << "[fit] WARNING: likelihood is flat along";
      for (const auto& p : out.flat_parameters) os << " '" << p << "'";
      os << " at the global maximum; the estimate there is not informative"
         << " and may depend on the starting guess.\n";
      std::lock_guard<std::mutex> lk(LogMutex());
      std::cerr << os.str();
    }
  }

  return out;
}

} // namespace neymanplr
