#include "neymanplr/model/PoissonCountTerm.hh"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

double PoissonLogPmf(double n, double mu) {
  if (mu <= 0.0) {
    // both zero: certain outcome
    return (n <= 0.0) ? 0.0 : -std::numeric_limits<double>::infinity();
  }
  return n * std::log(mu) - mu - std::lgamma(n + 1.0);
}

PoissonCountTerm::PoissonCountTerm(std::shared_ptr<const SourceModel> sources, std::string name)
: sources_(std::move(sources)), name_(std::move(name))
{
  if (!sources_ || sources_->empty())
    throw std::invalid_argument("PoissonCountTerm: needs at least one source");
}

std::set<std::string> PoissonCountTerm::RequiredParameters() const {
  return sources_->RequiredParameters();
}

double PoissonCountTerm::LogContribution(const Dataset& data, const ParameterVector& params) const {
  const double mu_tot = sources_->TotalExpected(params, name_);
  return PoissonLogPmf(static_cast<double>(data.size()), mu_tot);
}

std::string PoissonCountTerm::Describe() const {
  std::ostringstream os;
  os << Kind() << " '" << name_ << "': n_obs ~ Poisson(mu_tot), mu_tot = ";
  for (std::size_t k = 0; k < sources_->size(); ++k) {
    const auto& s = sources_->source(k);
    if (k) os << " + ";
    os << "mu_" << s.spec.name;
  }
  return os.str();
}

} // namespace neymanplr
