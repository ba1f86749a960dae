#include <gtest/gtest.h>

#include "TestHelpers.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/model/PoissonRateTerm.hh"

#include <cmath>
#include <random>
#include <stdexcept>

using namespace neymanplr;

TEST(LikelihoodModel, CountingModelWithoutEvents) {
  auto model = test::MakeCountingModel();
  model->SetData({});
  EXPECT_NEAR(model->Evaluate({{"rate", 5.0}}), -5.0, 1e-12);

  const auto& fit = model->SetMaxLogLikelihood({{"rate", 5.0}});
  EXPECT_TRUE(fit.converged);
  EXPECT_NEAR(fit.params.at("rate"), 0.0, 1e-3);
  EXPECT_NEAR(fit.max_loglik, 0.0, 1e-3);
}

TEST(LikelihoodModel, MissingParameterIsNamed) {
  auto model = test::MakeSignalBackgroundModel();
  try {
    model->Evaluate({{"lg_bkg", 0.0}});
    FAIL() << "expected MissingParameter";
  } catch (const MissingParameter& e) {
    EXPECT_EQ(e.parameter(), "sig_rate");
  }
}

TEST(LikelihoodModel, ExtraParameterIsRejected) {
  auto model = test::MakeSignalBackgroundModel();
  try {
    model->Evaluate({{"lg_bkg", 0.0}, {"sig_rate", 1.0}, {"data", 0.0}});
    FAIL() << "expected InvalidParameter";
  } catch (const InvalidParameter& e) {
    EXPECT_EQ(e.parameter(), "data");
  }
}

TEST(LikelihoodModel, ParamNeededIsUnionOfTerms) {
  auto model = test::MakeSignalBackgroundModel();
  EXPECT_EQ(model->ParamNeeded(), (std::set<std::string>{"lg_bkg", "sig_rate"}));
  EXPECT_EQ(model->terms().size(), 3u);
}

TEST(LikelihoodModel, EvaluateIsFiniteAtDefaults) {
  auto model = test::MakeSignalBackgroundModel();
  std::mt19937_64 rng(11);
  model->SetDataFromToyMC(model->parameters().Defaults(), rng);
  const double ll = model->Evaluate(model->parameters().Defaults());
  EXPECT_TRUE(std::isfinite(ll));
  // pure: same value twice
  EXPECT_DOUBLE_EQ(ll, model->Evaluate(model->parameters().Defaults()));
}

TEST(LikelihoodModel, ConstructionChecksRegistry) {
  ParameterRegistry reg;
  reg.Add({"rate", 1.0, 0.0, 10.0});
  std::vector<TermPtr> undeclared{std::make_shared<PoissonRateTerm>("other")};
  EXPECT_THROW({ LikelihoodModel m(reg, undeclared); }, std::invalid_argument);

  reg.Add({"unused", 0.0});
  std::vector<TermPtr> terms{std::make_shared<PoissonRateTerm>("rate")};
  EXPECT_THROW({ LikelihoodModel m(reg, terms); }, std::invalid_argument);

  EXPECT_THROW({ LikelihoodModel m(ParameterRegistry{}, std::vector<TermPtr>{}); }, std::invalid_argument);
}

TEST(LikelihoodModel, DataMutationMakesFitStale) {
  auto model = test::MakeCountingModel();
  model->SetData({});
  EXPECT_FALSE(model->HasValidFit());
  EXPECT_THROW(model->GlobalFit(), StaleFitError);

  model->SetMaxLogLikelihood({{"rate", 5.0}});
  EXPECT_TRUE(model->HasValidFit());
  const auto gen = model->data_generation();
  EXPECT_EQ(model->GlobalFit().data_generation, gen);

  Dataset three(3, Event{{0.0}, -1});
  model->SetData(three);
  EXPECT_EQ(model->data_generation(), gen + 1);
  EXPECT_FALSE(model->HasValidFit());
  // the old result stays inspectable
  ASSERT_TRUE(model->fit_cache().result.has_value());
  try {
    model->GlobalFit();
    FAIL() << "expected StaleFitError";
  } catch (const StaleFitError& e) {
    EXPECT_EQ(e.data_generation(), gen + 1);
    ASSERT_TRUE(e.fit_generation().has_value());
    EXPECT_EQ(*e.fit_generation(), gen);
  }

  model->SetMaxLogLikelihood({{"rate", 5.0}});
  EXPECT_NEAR(model->GlobalFit().params.at("rate"), 3.0, 1e-2);
}

TEST(LikelihoodModel, SetDataChecksDimension) {
  auto model = test::MakeSignalBackgroundModel();
  Dataset bad{Event{{1.0, 2.0}, -1}};
  EXPECT_THROW(model->SetData(bad), std::invalid_argument);
}

TEST(LikelihoodModel, ToyMCNeedsSources) {
  auto model = test::MakeCountingModel();
  std::mt19937_64 rng(1);
  EXPECT_THROW(model->SetDataFromToyMC({{"rate", 5.0}}, rng), SimulationInconsistency);
}

TEST(LikelihoodModel, ViewListsParametersAndTerms) {
  auto model = test::MakeSignalBackgroundModel();
  const auto v = model->View();
  EXPECT_NE(v.find("lg_bkg"), std::string::npos);
  EXPECT_NE(v.find("sig_rate"), std::string::npos);
  EXPECT_NE(v.find("constraint_lg_bkg"), std::string::npos);
  EXPECT_NE(v.find("mixture_density"), std::string::npos);
}
