#include "neymanplr/model/GaussianConstraintTerm.hh"
#include "neymanplr/core/Errors.hh"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

GaussianConstraintTerm::GaussianConstraintTerm(std::string param, double mean, double sigma)
: param_(std::move(param)), mean_(mean), sigma_(sigma)
{
  if (!(sigma_ > 0.0) || !std::isfinite(sigma_))
    throw std::invalid_argument("constraint on '" + param_ + "': sigma must be finite and > 0");
  if (!std::isfinite(mean_))
    throw std::invalid_argument("constraint on '" + param_ + "': mean must be finite");
}

double GaussianConstraintTerm::LogContribution(const Dataset&, const ParameterVector& params) const {
  const double p = RequireParameter(params, param_, Name());
  if (!std::isfinite(p)) throw InvalidParameter(param_, Name(), "non-finite value");
  const double z = (p - mean_) / sigma_;
  return -0.5 * z * z;
}

std::string GaussianConstraintTerm::Describe() const {
  std::ostringstream os;
  os << Kind() << " '" << Name() << "': " << param_ << " ~ Gauss(" << mean_ << ", " << sigma_ << ")";
  return os.str();
}

} // namespace neymanplr
