#pragma once
#include <memory>

#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/model/SourceModel.hh"

namespace neymanplr {

class ConfigManager;
class TemplateStore;

/**
 * Assembles a LikelihoodModel from a parsed configuration:
 *   - sources  -> one SourceModel, shared by PoissonCountTerm and
 *                 MixtureDensityTerm (extended unbinned likelihood)
 *   - constraints -> one GaussianConstraintTerm each
 *   - counting    -> one PoissonRateTerm each
 * Fit settings are copied into the model.
 */
class ModelBuilder {
public:
  ModelBuilder(const ConfigManager& cfg, TemplateStore& store);

  /// Source model built once; later calls return the same instance.
  std::shared_ptr<const SourceModel> Sources();

  /// Fresh model with its own dataset and fit cache; terms and templates are shared.
  /// After the first call, Build() only reads shared state and may be called
  /// from calibration workers concurrently.
  std::unique_ptr<LikelihoodModel> Build();

private:
  const ConfigManager&               cfg_;
  TemplateStore&                     store_;
  std::shared_ptr<const SourceModel> sources_;
  std::vector<TermPtr>               terms_;
};

} // namespace neymanplr
