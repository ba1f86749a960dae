#pragma once

#include "neymanplr/model/ILikelihoodTerm.hh"

namespace neymanplr {

/// Auxiliary measurement of one parameter:
///   ln L = -0.5 * ((p - mean) / sigma)^2
class GaussianConstraintTerm : public ILikelihoodTerm {
public:
  GaussianConstraintTerm(std::string param, double mean, double sigma);

  std::string Name() const override { return "constraint_" + param_; }
  std::string Kind() const override { return "GaussianConstraint"; }
  std::set<std::string> RequiredParameters() const override { return {param_}; }
  double LogContribution(const Dataset& data, const ParameterVector& params) const override;
  std::string Describe() const override;

  double mean() const noexcept { return mean_; }
  double sigma() const noexcept { return sigma_; }

private:
  std::string param_;
  double      mean_;
  double      sigma_;
};

} // namespace neymanplr
