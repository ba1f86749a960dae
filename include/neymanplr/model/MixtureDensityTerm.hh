#pragma once
#include <memory>

#include "neymanplr/model/ILikelihoodTerm.hh"
#include "neymanplr/model/SourceModel.hh"

namespace neymanplr {

/**
 * Unbinned multi-source density of the observed events:
 *
 *   ln L = sum_i ln [ sum_k mu_k p_k(x_i) / mu_tot ]
 *
 * p_k is the normalized template density of source k, mu_k its expected
 * count. Events outside every template contribute the density floor.
 */
class MixtureDensityTerm : public ILikelihoodTerm {
public:
  explicit MixtureDensityTerm(std::shared_ptr<const SourceModel> sources,
                              std::string name = "mixture_density");

  std::string Name() const override { return name_; }
  std::string Kind() const override { return "MixtureDensity"; }
  std::set<std::string> RequiredParameters() const override;
  double LogContribution(const Dataset& data, const ParameterVector& params) const override;
  std::string Describe() const override;

private:
  std::shared_ptr<const SourceModel> sources_;
  std::string                        name_;
};

} // namespace neymanplr
