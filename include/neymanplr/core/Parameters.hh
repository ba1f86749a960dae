#pragma once
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace neymanplr {

/// Parameter vector: parameter name -> value.
using ParameterVector = std::map<std::string, double>;

enum class ParameterRole { Interesting, Nuisance };

struct ParameterSpec {
  std::string   name;
  double        default_value = 0.0;
  double        lower = -std::numeric_limits<double>::infinity();
  double        upper =  std::numeric_limits<double>::infinity();
  ParameterRole role  = ParameterRole::Nuisance;

  bool has_lower() const noexcept { return lower > -std::numeric_limits<double>::infinity(); }
  bool has_upper() const noexcept { return upper <  std::numeric_limits<double>::infinity(); }
  bool contains(double v) const noexcept { return v >= lower && v <= upper; }
};

/**
 * Declared parameters of a model: defaults, box bounds and the
 * interesting (Θ) / nuisance (Φ) split.
 */
class ParameterRegistry {
public:
  /// Throws std::invalid_argument on duplicates, lower > upper or a default
  /// outside [lower, upper].
  void Add(ParameterSpec spec);

  bool Has(const std::string& name) const;
  const ParameterSpec& Get(const std::string& name) const;   // MissingParameter if absent

  const std::vector<ParameterSpec>& specs() const noexcept { return specs_; }
  std::size_t size() const noexcept { return specs_.size(); }

  ParameterVector Defaults() const;
  std::vector<std::string> InterestingNames() const;
  std::vector<std::string> NuisanceNames() const;

private:
  std::vector<ParameterSpec> specs_;
  std::map<std::string, std::size_t> index_;
};

/// Value of `name` in `params`; throws MissingParameter mentioning `context`.
double RequireParameter(const ParameterVector& params,
                        const std::string& name,
                        const std::string& context);

std::string ToString(const ParameterVector& params);
std::string ToString(ParameterRole role);
ParameterRole ParseRole(const std::string& s);

std::set<std::string> KeysOf(const ParameterVector& params);

} // namespace neymanplr
