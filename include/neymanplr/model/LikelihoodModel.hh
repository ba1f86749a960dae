#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "neymanplr/core/Dataset.hh"
#include "neymanplr/core/FitResult.hh"
#include "neymanplr/core/Parameters.hh"
#include "neymanplr/fit/FitSettings.hh"
#include "neymanplr/model/ILikelihoodTerm.hh"
#include "neymanplr/model/SourceModel.hh"

namespace neymanplr {

using TermPtr = std::shared_ptr<const ILikelihoodTerm>;

/// Cached global maximum; valid only while its generation matches the dataset's.
struct FitCache {
  std::optional<FitResult> result;
};

/**
 * Joint likelihood of named parameters: the sum of its terms' log
 * contributions, evaluated on the model-owned dataset.
 *
 * State: the dataset and the cached global fit. Every dataset mutation
 * bumps data_generation(), which invalidates the cached fit (it stays
 * readable through fit_cache()); callers must run SetMaxLogLikelihood()
 * again before asking for a test statistic.
 *
 * One instance is not safe for concurrent mutation; calibration workers
 * each build their own. Terms and templates are immutable and may be shared.
 */
class LikelihoodModel {
public:
  /// Throws std::invalid_argument if a term uses a parameter that is not in
  /// `registry`, or a parameter of `registry` is used by no term.
  LikelihoodModel(ParameterRegistry registry,
                  std::vector<TermPtr> terms,
                  std::shared_ptr<const SourceModel> sources = nullptr);

  // -------- structure --------
  const std::set<std::string>& ParamNeeded() const noexcept { return param_needed_; }
  const ParameterRegistry& parameters() const noexcept { return registry_; }
  const std::vector<TermPtr>& terms() const noexcept { return terms_; }
  const std::shared_ptr<const SourceModel>& sources() const noexcept { return sources_; }

  /// Human-readable dump of parameters and terms (not machine-parseable).
  std::string View() const;

  // -------- evaluation --------
  /// Throws MissingParameter if a needed name is absent, InvalidParameter if
  /// an extra name is supplied or a value is outside a term's domain.
  void CheckParameters(const ParameterVector& params) const;

  /// ln L(data | params), summed over terms. Pure.
  double Evaluate(const ParameterVector& params) const;

  // -------- data --------
  const Dataset& data() const noexcept { return data_; }
  std::uint64_t data_generation() const noexcept { return data_generation_; }

  /// Replace the dataset. Events must match the source templates' dimension.
  void SetData(Dataset data);

  /// Replace the dataset with a toy drawn at `true_params`.
  void SetDataFromToyMC(const ParameterVector& true_params, std::mt19937_64& rng);

  // -------- global fit --------
  void SetFitSettings(const FitSettings& s) { fit_settings_ = s; }
  const FitSettings& fit_settings() const noexcept { return fit_settings_; }

  /// Maximize over all parameters from `param_guess` and cache the result.
  /// Throws ConvergenceFailure (cache left empty) when the fit fails.
  /// The result is a local maximum: its quality depends on the guess.
  const FitResult& SetMaxLogLikelihood(const ParameterVector& param_guess);

  bool HasValidFit() const noexcept;

  /// Cached global fit; StaleFitError if absent or from an older dataset.
  const FitResult& GlobalFit() const;

  const FitCache& fit_cache() const noexcept { return fit_cache_; }
  void InvalidateFit() noexcept { fit_cache_.result.reset(); }

private:
  ParameterRegistry                  registry_;
  std::vector<TermPtr>               terms_;
  std::shared_ptr<const SourceModel> sources_;
  std::set<std::string>              param_needed_;

  Dataset       data_;
  std::uint64_t data_generation_ = 0;

  FitSettings fit_settings_;
  FitCache    fit_cache_;
};

} // namespace neymanplr
