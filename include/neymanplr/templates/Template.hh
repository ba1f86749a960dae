#pragma once
#include <random>
#include <string>
#include <vector>

namespace neymanplr {

/**
 * Binned probability density over the event feature space of one source.
 *
 * Built from per-bin weights (expected counts at the reference rate). The
 * shape is normalized to unit integral over the domain; `norm()` keeps the
 * expected yield at the reference rate. Immutable after construction, so one
 * instance may be shared by any number of models and threads.
 *
 * Bin layout: `edges[a]` holds the n_a+1 edges of axis a; weights are stored
 * flattened with axis 0 running fastest.
 */
class Template {
public:
  /// norm = sum of weights.
  Template(std::string name,
           std::vector<std::vector<double>> edges,
           std::vector<double> weights);

  /// Shape from weights, yield given explicitly.
  Template(std::string name,
           std::vector<std::vector<double>> edges,
           std::vector<double> weights,
           double norm);

  const std::string& name() const noexcept { return name_; }
  int ndim() const noexcept { return static_cast<int>(edges_.size()); }
  double norm() const noexcept { return norm_; }
  std::size_t nbins() const noexcept { return density_.size(); }
  const std::vector<double>& edges(int axis) const { return edges_.at(static_cast<std::size_t>(axis)); }

  /// Probability density at x; 0 outside the domain.
  double Density(const std::vector<double>& x) const;

  bool Contains(const std::vector<double>& x) const;

  /// Draw one point: bin by inverse CDF, then uniform inside the bin.
  std::vector<double> Sample(std::mt19937_64& rng) const;

  /// "name [nd, nbins, norm=...]"
  std::string Summary() const;

private:
  void Build_(std::vector<double> weights);
  long FindBin_(const std::vector<double>& x) const;   // -1 outside

  std::string                      name_;
  std::vector<std::vector<double>> edges_;
  std::vector<double>              density_;   // per bin, unit integral
  std::vector<double>              cdf_;       // cumulative bin probability
  double                           norm_ = 0.0;
};

} // namespace neymanplr
