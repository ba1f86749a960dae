#pragma once
#include <memory>

#include "neymanplr/model/ILikelihoodTerm.hh"
#include "neymanplr/model/SourceModel.hh"

namespace neymanplr {

/**
 * Poisson probability of the observed number of events given the total
 * expected count of all sources:
 *
 *   ln L = n ln(mu_tot) - mu_tot - ln(n!)
 *
 * Together with MixtureDensityTerm this forms the extended unbinned
 * likelihood.
 */
class PoissonCountTerm : public ILikelihoodTerm {
public:
  explicit PoissonCountTerm(std::shared_ptr<const SourceModel> sources,
                            std::string name = "poisson_count");

  std::string Name() const override { return name_; }
  std::string Kind() const override { return "PoissonCount"; }
  std::set<std::string> RequiredParameters() const override;
  double LogContribution(const Dataset& data, const ParameterVector& params) const override;
  std::string Describe() const override;

private:
  std::shared_ptr<const SourceModel> sources_;
  std::string                        name_;
};

/// Poisson log-probability ln P(n | mu); 0 for (n=0, mu=0), -inf for (n>0, mu=0).
double PoissonLogPmf(double n, double mu);

} // namespace neymanplr
