#include "neymanplr/templates/Template.hh"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

Template::Template(std::string name,
                   std::vector<std::vector<double>> edges,
                   std::vector<double> weights)
: name_(std::move(name)), edges_(std::move(edges))
{
  double sum = 0.0;
  for (double w : weights) sum += w;
  norm_ = sum;
  Build_(std::move(weights));
}

Template::Template(std::string name,
                   std::vector<std::vector<double>> edges,
                   std::vector<double> weights,
                   double norm)
: name_(std::move(name)), edges_(std::move(edges)), norm_(norm)
{
  if (!(norm > 0.0) || !std::isfinite(norm))
    throw std::invalid_argument("template '" + name_ + "': norm must be finite and > 0");
  Build_(std::move(weights));
}

void Template::Build_(std::vector<double> weights) {
  if (edges_.empty())
    throw std::invalid_argument("template '" + name_ + "': no axes");

  std::size_t nb = 1;
  for (const auto& e : edges_) {
    if (e.size() < 2)
      throw std::invalid_argument("template '" + name_ + "': axis needs at least one bin");
    for (std::size_t i = 1; i < e.size(); ++i)
      if (!(e[i] > e[i-1]))
        throw std::invalid_argument("template '" + name_ + "': bin edges must increase");
    nb *= (e.size() - 1);
  }
  if (weights.size() != nb)
    throw std::invalid_argument("template '" + name_ + "': weight count does not match bins");

  double sum = 0.0;
  for (double w : weights) {
    if (w < 0.0 || !std::isfinite(w))
      throw std::invalid_argument("template '" + name_ + "': negative or non-finite bin content");
    sum += w;
  }
  if (!(sum > 0.0))
    throw std::invalid_argument("template '" + name_ + "': empty template");
  if (!(norm_ > 0.0))
    throw std::invalid_argument("template '" + name_ + "': norm must be > 0");

  density_.assign(nb, 0.0);
  cdf_.assign(nb, 0.0);
  double acc = 0.0;
  for (std::size_t b = 0; b < nb; ++b) {
    // bin volume from the per-axis widths
    double vol = 1.0;
    std::size_t rest = b;
    for (const auto& e : edges_) {
      const std::size_t n = e.size() - 1;
      const std::size_t i = rest % n;
      rest /= n;
      vol *= (e[i+1] - e[i]);
    }
    const double p = weights[b] / sum;
    density_[b] = p / vol;
    acc += p;
    cdf_[b] = acc;
  }
  cdf_.back() = 1.0;
}

long Template::FindBin_(const std::vector<double>& x) const {
  if (x.size() != edges_.size()) return -1;
  long idx = 0;
  long stride = 1;
  for (std::size_t a = 0; a < edges_.size(); ++a) {
    const auto& e = edges_[a];
    const double xa = x[a];
    if (!(xa >= e.front() && xa <= e.back())) return -1;
    auto it = std::upper_bound(e.begin(), e.end(), xa);
    long i = static_cast<long>(it - e.begin()) - 1;
    const long n = static_cast<long>(e.size()) - 1;
    if (i >= n) i = n - 1;   // upper edge belongs to the last bin
    idx += i * stride;
    stride *= n;
  }
  return idx;
}

bool Template::Contains(const std::vector<double>& x) const {
  return FindBin_(x) >= 0;
}

double Template::Density(const std::vector<double>& x) const {
  const long b = FindBin_(x);
  return (b < 0) ? 0.0 : density_[static_cast<std::size_t>(b)];
}

std::vector<double> Template::Sample(std::mt19937_64& rng) const {
  std::uniform_real_distribution<double> uni(0.0, 1.0);
  const double u = uni(rng);
  auto it = std::lower_bound(cdf_.begin(), cdf_.end(), u);
  std::size_t b = static_cast<std::size_t>(it - cdf_.begin());
  if (b >= cdf_.size()) b = cdf_.size() - 1;
  // skip empty bins hit exactly at a CDF plateau
  while (b + 1 < cdf_.size() && density_[b] <= 0.0) ++b;

  std::vector<double> x(edges_.size());
  std::size_t rest = b;
  for (std::size_t a = 0; a < edges_.size(); ++a) {
    const auto& e = edges_[a];
    const std::size_t n = e.size() - 1;
    const std::size_t i = rest % n;
    rest /= n;
    x[a] = e[i] + uni(rng) * (e[i+1] - e[i]);
  }
  return x;
}

std::string Template::Summary() const {
  std::ostringstream os;
  os << name_ << " [" << ndim() << "d, " << nbins() << " bins, norm=" << norm_ << "]";
  return os.str();
}

} // namespace neymanplr
