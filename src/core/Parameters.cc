#include "neymanplr/core/Parameters.hh"
#include "neymanplr/core/Errors.hh"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

void ParameterRegistry::Add(ParameterSpec spec) {
  if (spec.name.empty()) throw std::invalid_argument("parameter name must not be empty");
  if (index_.count(spec.name))
    throw std::invalid_argument("parameter '" + spec.name + "' declared twice");
  if (spec.lower > spec.upper)
    throw std::invalid_argument("parameter '" + spec.name + "': lower > upper");
  if (!spec.contains(spec.default_value))
    throw std::invalid_argument("parameter '" + spec.name + "': default outside [lower, upper]");

  index_[spec.name] = specs_.size();
  specs_.push_back(std::move(spec));
}

bool ParameterRegistry::Has(const std::string& name) const {
  return index_.count(name) > 0;
}

const ParameterSpec& ParameterRegistry::Get(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) throw MissingParameter(name, "parameter registry");
  return specs_[it->second];
}

ParameterVector ParameterRegistry::Defaults() const {
  ParameterVector out;
  for (const auto& s : specs_) out[s.name] = s.default_value;
  return out;
}

std::vector<std::string> ParameterRegistry::InterestingNames() const {
  std::vector<std::string> out;
  for (const auto& s : specs_)
    if (s.role == ParameterRole::Interesting) out.push_back(s.name);
  return out;
}

std::vector<std::string> ParameterRegistry::NuisanceNames() const {
  std::vector<std::string> out;
  for (const auto& s : specs_)
    if (s.role == ParameterRole::Nuisance) out.push_back(s.name);
  return out;
}

double RequireParameter(const ParameterVector& params,
                        const std::string& name,
                        const std::string& context) {
  auto it = params.find(name);
  if (it == params.end()) throw MissingParameter(name, context);
  return it->second;
}

std::string ToString(const ParameterVector& params) {
  std::ostringstream os;
  os << "{";
  bool first = true;
  for (const auto& [name, value] : params) {
    if (!first) os << ", ";
    os << name << "=" << value;
    first = false;
  }
  os << "}";
  return os.str();
}

std::string ToString(ParameterRole role) {
  switch (role) {
    case ParameterRole::Interesting: return "interesting";
    case ParameterRole::Nuisance:    return "nuisance";
  }
  return "unknown";
}

ParameterRole ParseRole(const std::string& s) {
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (l == "interesting" || l == "poi") return ParameterRole::Interesting;
  if (l == "nuisance")                  return ParameterRole::Nuisance;
  throw std::invalid_argument("parameter role must be interesting/nuisance, got '" + s + "'");
}

std::set<std::string> KeysOf(const ParameterVector& params) {
  std::set<std::string> out;
  for (const auto& kv : params) out.insert(kv.first);
  return out;
}

} // namespace neymanplr
