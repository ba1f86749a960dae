#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "neymanplr/core/Parameters.hh"
#include "neymanplr/stats/ITestStatistic.hh"

namespace neymanplr {

class LikelihoodModel;

struct HypothesisPoint {
  std::string     label;
  ParameterVector theta_fixed;   // Θ
  ParameterVector phi_guess;     // starting Φ for profiling (may be empty)
  ParameterVector phi_true;      // Φ the toys are drawn at (empty: from true_params)
};

struct CalibrationConfig {
  int             n_toys    = 0;
  int             n_threads = 1;
  std::uint64_t   rng_seed  = 12345;
  ParameterVector true_params;      ///< Φ for toys of hypotheses without phi_true
  ParameterVector global_guess;     ///< start of each toy's global fit (empty: the toy's truth)
  std::vector<HypothesisPoint> hypotheses;
  int             verbosity = 0;
};

/// Point the toys of `h` are drawn at: `true_params`, overridden by
/// h.phi_true, overridden by h.theta_fixed.
ParameterVector GenerationPoint(const CalibrationConfig& cfg, const HypothesisPoint& h);

/// Empirical distribution of t at one hypothesis point.
struct CalibrationResult {
  HypothesisPoint     hypothesis;
  ParameterVector     truth;          // point the toys were drawn at
  std::vector<double> t_values;       // in toy order, failed toys skipped
  int                 n_failed_fits = 0;
  int                 n_negative    = 0;

  /// Empirical quantile (linear interpolation between order statistics).
  double Quantile(double p) const;

  /// Fraction of toys with t >= t_obs.
  double PValue(double t_obs) const;
};

/**
 * Monte Carlo Neyman construction. For every hypothesis point, n_toys toys
 * are drawn at that hypothesis (GenerationPoint); each toy gets a global fit
 * and the statistic is evaluated at the same hypothesis. The result is the
 * null distribution of t at each point, so Quantile(cl) is its critical value.
 *
 * Toys are spread over n_threads workers. Each worker gets its own model
 * from the factory; the statistic object is shared (its Compute is const).
 * Toy i of hypothesis h uses an RNG seeded from (rng_seed, h, i), so results
 * do not depend on the number of threads. Toys whose fit does not converge
 * are counted in n_failed_fits and left out of t_values.
 */
class NeymanCalibrator {
public:
  using ModelFactory = std::function<std::unique_ptr<LikelihoodModel>()>;

  NeymanCalibrator(ModelFactory factory,
                   std::shared_ptr<const stats::ITestStatistic> statistic,
                   CalibrationConfig cfg);

  std::vector<CalibrationResult> Run() const;

private:
  void RunWorker_(int worker, int n_workers,
                  std::vector<std::vector<double>>& t_by_hyp,
                  std::vector<std::vector<char>>& failed_by_hyp,
                  std::vector<std::vector<char>>& negative_by_hyp) const;

  ModelFactory                                 factory_;
  std::shared_ptr<const stats::ITestStatistic> statistic_;
  CalibrationConfig                            cfg_;
};

} // namespace neymanplr
