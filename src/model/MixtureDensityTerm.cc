#include "neymanplr/model/MixtureDensityTerm.hh"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

namespace {

inline double safe_log(double x) {
  // Very small positive floor to avoid log(0)
  constexpr double kMin = 1e-300;
  return std::log(x < kMin ? kMin : x);
}

} // namespace

MixtureDensityTerm::MixtureDensityTerm(std::shared_ptr<const SourceModel> sources, std::string name)
: sources_(std::move(sources)), name_(std::move(name))
{
  if (!sources_ || sources_->empty())
    throw std::invalid_argument("MixtureDensityTerm: needs at least one source");
}

std::set<std::string> MixtureDensityTerm::RequiredParameters() const {
  return sources_->RequiredParameters();
}

double MixtureDensityTerm::LogContribution(const Dataset& data, const ParameterVector& params) const {
  const std::vector<double> mu = sources_->ExpectedCounts(params, name_);
  if (data.empty()) return 0.0;

  double mu_tot = 0.0;
  for (double m : mu) mu_tot += m;
  // events observed but nothing expected: impossible
  if (!(mu_tot > 0.0)) return -std::numeric_limits<double>::infinity();

  const std::size_t nsrc = sources_->size();
  double ll = 0.0;
  for (const auto& ev : data) {
    double f = 0.0;
    for (std::size_t k = 0; k < nsrc; ++k) {
      if (mu[k] <= 0.0) continue;
      f += mu[k] * sources_->source(k).tmpl->Density(ev.x);
    }
    ll += safe_log(f / mu_tot);
  }
  return ll;
}

std::string MixtureDensityTerm::Describe() const {
  std::ostringstream os;
  os << Kind() << " '" << name_ << "': sum_i ln sum_k f_k p_k(x_i) over "
     << sources_->ndim() << "d events;";
  for (const auto& s : sources_->sources()) {
    os << " [" << s.spec.name << ": template=" << s.tmpl->Summary()
       << ", mu = norm*" << (s.spec.transform == RateTransform::Log10 ? "10^" : "")
       << s.spec.rate_param << "]";
  }
  return os.str();
}

} // namespace neymanplr
