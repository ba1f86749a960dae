#pragma once
#include <set>
#include <string>

#include "neymanplr/core/FitResult.hh"
#include "neymanplr/core/Parameters.hh"
#include "neymanplr/fit/FitSettings.hh"

namespace neymanplr {

class LikelihoodModel;

/**
 * Maximizes LikelihoodModel::Evaluate with ROOT's Minuit2 (Migrad) by
 * minimizing -ln L.
 *
 * - Parameters named in `fixed` are held at their guess values.
 * - Box bounds come from the model's ParameterRegistry; a guess outside its
 *   bounds is rejected with InvalidParameter, never clamped.
 * - Evaluations that a term rejects (InvalidParameter) or that are not
 *   finite are answered with a large penalty and counted in n_rejected.
 * - Budget: settings.max_function_calls. Exhausting it, or missing the
 *   tolerance, throws ConvergenceFailure carrying the best point found.
 * - Global fits run Hesse. A parameter whose curvature is below
 *   flat_curvature_threshold is reported flat, unless its best value sits
 *   on a box bound. A failed Hesse sets hesse_failed and skips the check.
 *
 * Migrad is a local optimizer. On flat or multimodal surfaces the result
 * depends on the guess; callers should try more than one guess when in doubt.
 */
class Profiler {
public:
  explicit Profiler(FitSettings settings = {});

  FitResult Maximize(const LikelihoodModel& model,
                     const ParameterVector& guess,
                     const std::set<std::string>& fixed) const;

  /// All parameters free.
  FitResult MaximizeGlobal(const LikelihoodModel& model, const ParameterVector& guess) const;

  /// Θ held at `theta_fixed`, Φ maximized from `phi_guess`.
  FitResult Profile(const LikelihoodModel& model,
                    const ParameterVector& theta_fixed,
                    const ParameterVector& phi_guess) const;

  const FitSettings& settings() const noexcept { return settings_; }

private:
  FitSettings settings_;
};

} // namespace neymanplr
