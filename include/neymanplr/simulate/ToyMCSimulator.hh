#pragma once
#include <memory>
#include <random>

#include "neymanplr/core/Dataset.hh"
#include "neymanplr/core/Parameters.hh"
#include "neymanplr/model/SourceModel.hh"

namespace neymanplr {

/**
 * Draws toy datasets from the same SourceModel the likelihood evaluates:
 *
 *   N      ~ Poisson(mu_tot(params))
 *   k_i    ~ Categorical(mu_k / mu_tot)
 *   x_i    ~ p_{k_i}            (template of source k_i)
 *
 * Each event records its generating source index.
 */
class ToyMCSimulator {
public:
  explicit ToyMCSimulator(std::shared_ptr<const SourceModel> sources);

  /// Throws MissingParameter / InvalidParameter for bad rates and
  /// SimulationInconsistency if a drawn event has no density under the
  /// template it was drawn from.
  Dataset Simulate(const ParameterVector& true_params, std::mt19937_64& rng) const;

  const std::shared_ptr<const SourceModel>& sources() const noexcept { return sources_; }

private:
  std::shared_ptr<const SourceModel> sources_;
};

} // namespace neymanplr
