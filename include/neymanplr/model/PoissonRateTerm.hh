#pragma once

#include "neymanplr/model/ILikelihoodTerm.hh"

namespace neymanplr {

/**
 * Counting-experiment term with the expected count given directly by one
 * parameter:
 *
 *   ln L = n ln(lambda) - lambda - ln(n!),   lambda >= 0
 *
 * n is the number of events in the dataset.
 */
class PoissonRateTerm : public ILikelihoodTerm {
public:
  explicit PoissonRateTerm(std::string rate_param);

  std::string Name() const override { return "poisson_" + param_; }
  std::string Kind() const override { return "PoissonRate"; }
  std::set<std::string> RequiredParameters() const override { return {param_}; }
  double LogContribution(const Dataset& data, const ParameterVector& params) const override;
  std::string Describe() const override;

private:
  std::string param_;
};

} // namespace neymanplr
