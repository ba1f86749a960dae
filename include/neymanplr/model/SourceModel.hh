#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "neymanplr/core/Parameters.hh"
#include "neymanplr/templates/Template.hh"

namespace neymanplr {

/// How a source's rate parameter scales its template norm.
enum class RateTransform {
  Log10,   ///< mu = norm * 10^p     (any real p)
  Linear   ///< mu = norm * p        (p >= 0)
};

struct SourceSpec {
  std::string   name;            // "er", "nr", "wimp", ...
  std::string   template_name;
  std::string   rate_param;      // e.g. "lg_er_rate"
  RateTransform transform = RateTransform::Log10;
};

struct Source {
  SourceSpec                      spec;
  std::shared_ptr<const Template> tmpl;
};

/**
 * The generative model shared by the likelihood terms and the toy
 * simulator: a list of sources, each a template scaled by one rate
 * parameter. Every expected count used anywhere in the engine comes from
 * ExpectedCounts(), so evaluation and simulation cannot drift apart.
 */
class SourceModel {
public:
  SourceModel() = default;

  /// Throws std::invalid_argument on duplicate names, null templates or a
  /// template dimension different from the sources already added.
  void AddSource(SourceSpec spec, std::shared_ptr<const Template> tmpl);

  std::size_t size() const noexcept { return sources_.size(); }
  bool empty() const noexcept { return sources_.empty(); }
  const Source& source(std::size_t i) const { return sources_.at(i); }
  const std::vector<Source>& sources() const noexcept { return sources_; }
  int ndim() const noexcept { return ndim_; }

  std::set<std::string> RequiredParameters() const;

  /// Expected count per source, in source order. Throws MissingParameter or
  /// InvalidParameter (naming `term`) for absent or out-of-domain values.
  std::vector<double> ExpectedCounts(const ParameterVector& params,
                                     const std::string& term) const;

  double TotalExpected(const ParameterVector& params, const std::string& term) const;

  static double ApplyTransform(RateTransform t, double value, double norm);

private:
  std::vector<Source> sources_;
  int                 ndim_ = 0;
};

std::string ToString(RateTransform t);
RateTransform ParseRateTransform(const std::string& s);

} // namespace neymanplr
