#include "neymanplr/model/ModelBuilder.hh"
#include "neymanplr/io/ConfigManager.hh"
#include "neymanplr/model/GaussianConstraintTerm.hh"
#include "neymanplr/model/MixtureDensityTerm.hh"
#include "neymanplr/model/PoissonCountTerm.hh"
#include "neymanplr/model/PoissonRateTerm.hh"
#include "neymanplr/templates/TemplateStore.hh"

#include <iostream>

namespace neymanplr {

ModelBuilder::ModelBuilder(const ConfigManager& cfg, TemplateStore& store)
: cfg_(cfg), store_(store) {}

std::shared_ptr<const SourceModel> ModelBuilder::Sources() {
  if (sources_ || cfg_.sources().empty()) return sources_;

  auto sm = std::make_shared<SourceModel>();
  for (const auto& spec : cfg_.sources()) {
    auto tmpl = store_.Get(spec.template_name);
    if (cfg_.run().verbosity > 1) {
      std::cout << "[templates] " << spec.name << " <- " << tmpl->Summary() << "\n";
    }
    sm->AddSource(spec, std::move(tmpl));
  }
  sources_ = std::move(sm);
  return sources_;
}

std::unique_ptr<LikelihoodModel> ModelBuilder::Build() {
  if (terms_.empty()) {
    if (auto sm = Sources()) {
      terms_.push_back(std::make_shared<PoissonCountTerm>(sm));
      terms_.push_back(std::make_shared<MixtureDensityTerm>(sm));
    }
    for (const auto& c : cfg_.constraints())
      terms_.push_back(std::make_shared<GaussianConstraintTerm>(c.param, c.mean, c.sigma));
    for (const auto& p : cfg_.counting())
      terms_.push_back(std::make_shared<PoissonRateTerm>(p));
  }

  auto model = std::make_unique<LikelihoodModel>(cfg_.MakeRegistry(), terms_, sources_);
  model->SetFitSettings(cfg_.fit());
  return model;
}

} // namespace neymanplr
