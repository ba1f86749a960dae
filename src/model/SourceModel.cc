#include "neymanplr/model/SourceModel.hh"
#include "neymanplr/core/Errors.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace neymanplr {

void SourceModel::AddSource(SourceSpec spec, std::shared_ptr<const Template> tmpl) {
  if (!tmpl) throw std::invalid_argument("source '" + spec.name + "': null template");
  if (spec.rate_param.empty())
    throw std::invalid_argument("source '" + spec.name + "': no rate parameter");
  for (const auto& s : sources_)
    if (s.spec.name == spec.name)
      throw std::invalid_argument("source '" + spec.name + "' added twice");

  if (sources_.empty()) {
    ndim_ = tmpl->ndim();
  } else if (tmpl->ndim() != ndim_) {
    throw std::invalid_argument("source '" + spec.name + "': template '" + tmpl->name() +
                                "' has a different dimension than the other sources");
  }
  sources_.push_back(Source{std::move(spec), std::move(tmpl)});
}

std::set<std::string> SourceModel::RequiredParameters() const {
  std::set<std::string> out;
  for (const auto& s : sources_) out.insert(s.spec.rate_param);
  return out;
}

double SourceModel::ApplyTransform(RateTransform t, double value, double norm) {
  switch (t) {
    case RateTransform::Log10:  return norm * std::pow(10.0, value);
    case RateTransform::Linear: return norm * value;
  }
  return 0.0;
}

std::vector<double> SourceModel::ExpectedCounts(const ParameterVector& params,
                                                const std::string& term) const {
  std::vector<double> mu(sources_.size());
  for (std::size_t k = 0; k < sources_.size(); ++k) {
    const auto& s = sources_[k];
    const double p = RequireParameter(params, s.spec.rate_param, term);

    if (!std::isfinite(p))
      throw InvalidParameter(s.spec.rate_param, term, "non-finite value");
    if (s.spec.transform == RateTransform::Linear && p < 0.0)
      throw InvalidParameter(s.spec.rate_param, term,
                             "negative rate multiplier " + std::to_string(p) +
                             " for source '" + s.spec.name + "'");

    mu[k] = ApplyTransform(s.spec.transform, p, s.tmpl->norm());
    if (!std::isfinite(mu[k]))
      throw InvalidParameter(s.spec.rate_param, term,
                             "expected count overflows for source '" + s.spec.name + "'");
  }
  return mu;
}

double SourceModel::TotalExpected(const ParameterVector& params, const std::string& term) const {
  double tot = 0.0;
  for (double m : ExpectedCounts(params, term)) tot += m;
  return tot;
}

std::string ToString(RateTransform t) {
  switch (t) {
    case RateTransform::Log10:  return "log10";
    case RateTransform::Linear: return "linear";
  }
  return "unknown";
}

RateTransform ParseRateTransform(const std::string& s) {
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (l == "log10" || l == "lg") return RateTransform::Log10;
  if (l == "linear")             return RateTransform::Linear;
  throw std::invalid_argument("rate transform must be log10/linear, got '" + s + "'");
}

} // namespace neymanplr
