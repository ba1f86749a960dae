#include "neymanplr/simulate/ToyMCSimulator.hh"
#include "neymanplr/core/Errors.hh"

#include <stdexcept>
#include <utility>

namespace neymanplr {

ToyMCSimulator::ToyMCSimulator(std::shared_ptr<const SourceModel> sources)
: sources_(std::move(sources))
{
  if (!sources_ || sources_->empty())
    throw std::invalid_argument("ToyMCSimulator: needs at least one source");
}

Dataset ToyMCSimulator::Simulate(const ParameterVector& true_params, std::mt19937_64& rng) const {
  const std::vector<double> mu = sources_->ExpectedCounts(true_params, "toy simulation");

  double mu_tot = 0.0;
  for (double m : mu) mu_tot += m;

  Dataset out;
  if (!(mu_tot > 0.0)) return out;

  std::poisson_distribution<long long> pois(mu_tot);
  const long long n = pois(rng);
  out.reserve(static_cast<std::size_t>(n));

  std::discrete_distribution<int> pick(mu.begin(), mu.end());
  for (long long i = 0; i < n; ++i) {
    const int k = pick(rng);
    const auto& src = sources_->source(static_cast<std::size_t>(k));

    Event ev;
    ev.x = src.tmpl->Sample(rng);
    ev.source = k;

    if (static_cast<int>(ev.x.size()) != sources_->ndim())
      throw SimulationInconsistency(src.spec.name, "sampled event dimension differs from model");
    if (!(src.tmpl->Density(ev.x) > 0.0))
      throw SimulationInconsistency(src.spec.name,
                                    "event drawn where template '" + src.tmpl->name() +
                                    "' has zero density");
    out.push_back(std::move(ev));
  }
  return out;
}

} // namespace neymanplr
