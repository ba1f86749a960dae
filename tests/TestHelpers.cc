#include "TestHelpers.hh"

#include "neymanplr/model/GaussianConstraintTerm.hh"
#include "neymanplr/model/MixtureDensityTerm.hh"
#include "neymanplr/model/PoissonCountTerm.hh"
#include "neymanplr/model/PoissonRateTerm.hh"
#include "neymanplr/model/SourceModel.hh"

#include <cmath>
#include <vector>

namespace neymanplr::test {

namespace {

std::vector<double> uniform_edges(double lo, double hi, int nbins) {
  std::vector<double> e(static_cast<std::size_t>(nbins) + 1);
  for (int i = 0; i <= nbins; ++i) e[static_cast<std::size_t>(i)] = lo + (hi - lo) * i / nbins;
  return e;
}

} // namespace

std::shared_ptr<const Template> MakeFlatTemplate(const std::string& name,
                                                 double lo, double hi, int nbins, double norm) {
  std::vector<double> w(static_cast<std::size_t>(nbins), 1.0);
  return std::make_shared<const Template>(name, std::vector<std::vector<double>>{uniform_edges(lo, hi, nbins)},
                                          w, norm);
}

std::shared_ptr<const Template> MakePeakTemplate(const std::string& name,
                                                 double lo, double hi, int nbins,
                                                 double mean, double sigma, double norm) {
  const auto e = uniform_edges(lo, hi, nbins);
  std::vector<double> w(static_cast<std::size_t>(nbins));
  for (int i = 0; i < nbins; ++i) {
    const double c = 0.5 * (e[static_cast<std::size_t>(i)] + e[static_cast<std::size_t>(i) + 1]);
    const double z = (c - mean) / sigma;
    w[static_cast<std::size_t>(i)] = std::exp(-0.5 * z * z) + 1e-9;
  }
  return std::make_shared<const Template>(name, std::vector<std::vector<double>>{e}, w, norm);
}

std::unique_ptr<LikelihoodModel> MakeSignalBackgroundModel() {
  ParameterRegistry reg;
  reg.Add({"lg_bkg", 0.0, -2.0, 2.0, ParameterRole::Nuisance});
  reg.Add({"sig_rate", 1.0, 0.0, 100.0, ParameterRole::Interesting});

  auto sm = std::make_shared<SourceModel>();
  sm->AddSource({"bkg", "bkg", "lg_bkg", RateTransform::Log10}, MakeFlatTemplate("bkg", 0.0, 10.0, 20, 50.0));
  sm->AddSource({"sig", "sig", "sig_rate", RateTransform::Linear},
                MakePeakTemplate("sig", 0.0, 10.0, 40, 5.0, 0.3, 1.0));
  std::shared_ptr<const SourceModel> sources = sm;

  std::vector<TermPtr> terms{
    std::make_shared<PoissonCountTerm>(sources),
    std::make_shared<MixtureDensityTerm>(sources),
    std::make_shared<GaussianConstraintTerm>("lg_bkg", 0.0, 0.1),
  };
  return std::make_unique<LikelihoodModel>(std::move(reg), std::move(terms), sources);
}

std::unique_ptr<LikelihoodModel> MakeSingleSourceModel() {
  ParameterRegistry reg;
  reg.Add({"mu", 10.0, 0.0, 200.0, ParameterRole::Interesting});

  auto sm = std::make_shared<SourceModel>();
  sm->AddSource({"sig", "sig", "mu", RateTransform::Linear}, MakeFlatTemplate("sig", 0.0, 10.0, 10, 1.0));
  std::shared_ptr<const SourceModel> sources = sm;

  std::vector<TermPtr> terms{
    std::make_shared<PoissonCountTerm>(sources),
    std::make_shared<MixtureDensityTerm>(sources),
  };
  return std::make_unique<LikelihoodModel>(std::move(reg), std::move(terms), sources);
}

std::unique_ptr<LikelihoodModel> MakeCountingModel() {
  ParameterRegistry reg;
  reg.Add({"rate", 5.0, 0.0, 100.0, ParameterRole::Interesting});
  std::vector<TermPtr> terms{std::make_shared<PoissonRateTerm>("rate")};
  return std::make_unique<LikelihoodModel>(std::move(reg), std::move(terms));
}

} // namespace neymanplr::test
