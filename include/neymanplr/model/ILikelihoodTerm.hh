#pragma once

#include <set>
#include <string>

#include "neymanplr/core/Dataset.hh"
#include "neymanplr/core/Parameters.hh"

namespace neymanplr {

/**
 * Abstract interface for one factor of the joint likelihood.
 *
 * The joint log-likelihood of a model is the sum of LogContribution() over
 * its terms:
 *   ln L(data | params) = sum_t  ln L_t(data | params)
 *
 * Implementations:
 *  - read only the parameters they list in RequiredParameters(),
 *  - throw MissingParameter / InvalidParameter instead of clamping,
 *  - keep no mutable state, so one term may serve many evaluations.
 */
class ILikelihoodTerm {
public:
  virtual ~ILikelihoodTerm() = default;

  /// Short unique name used in error messages, e.g. "poisson_count".
  virtual std::string Name() const = 0;

  /// Term kind, e.g. "PoissonCount", "MixtureDensity", "GaussianConstraint".
  virtual std::string Kind() const = 0;

  virtual std::set<std::string> RequiredParameters() const = 0;

  /// ln L_t(data | params); additive constants may be dropped but must not
  /// depend on params.
  virtual double LogContribution(const Dataset& data,
                                 const ParameterVector& params) const = 0;

  /// One line for LikelihoodModel::View().
  virtual std::string Describe() const = 0;
};

} // namespace neymanplr
