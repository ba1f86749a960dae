#include "neymanplr/model/PoissonRateTerm.hh"
#include "neymanplr/model/PoissonCountTerm.hh"
#include "neymanplr/core/Errors.hh"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace neymanplr {

PoissonRateTerm::PoissonRateTerm(std::string rate_param)
: param_(std::move(rate_param))
{
  if (param_.empty()) throw std::invalid_argument("PoissonRateTerm: empty parameter name");
}

double PoissonRateTerm::LogContribution(const Dataset& data, const ParameterVector& params) const {
  const double lambda = RequireParameter(params, param_, Name());
  if (!std::isfinite(lambda)) throw InvalidParameter(param_, Name(), "non-finite rate");
  if (lambda < 0.0)
    throw InvalidParameter(param_, Name(), "negative rate " + std::to_string(lambda));
  return PoissonLogPmf(static_cast<double>(data.size()), lambda);
}

std::string PoissonRateTerm::Describe() const {
  return Kind() + " '" + Name() + "': n_obs ~ Poisson(" + param_ + ")";
}

} // namespace neymanplr
