#include <gtest/gtest.h>

#include "TestHelpers.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/stats/ProfileLikelihoodRatio.hh"
#include "neymanplr/stats/TestStatisticFactory.hh"

#include <cmath>
#include <random>
#include <stdexcept>

using namespace neymanplr;
using neymanplr::stats::ProfileLikelihoodRatio;
using neymanplr::stats::OneSidedProfileLikelihoodRatio;

namespace {

class StatisticTest : public ::testing::Test {
protected:
  void SetUp() override {
    model_ = test::MakeSignalBackgroundModel();
    std::mt19937_64 rng(99);
    model_->SetDataFromToyMC({{"lg_bkg", 0.0}, {"sig_rate", 10.0}}, rng);
    model_->SetMaxLogLikelihood(model_->parameters().Defaults());
  }

  std::unique_ptr<LikelihoodModel> model_;
};

} // namespace

TEST(ProfileLikelihoodRatio, RequiresGlobalFit) {
  auto model = test::MakeSignalBackgroundModel();
  std::mt19937_64 rng(5);
  model->SetDataFromToyMC(model->parameters().Defaults(), rng);

  ProfileLikelihoodRatio plr(FitSettings{});
  EXPECT_THROW(plr.Evaluate(*model, {{"sig_rate", 1.0}}, {}), StaleFitError);

  model->SetMaxLogLikelihood(model->parameters().Defaults());
  EXPECT_NO_THROW(plr.Evaluate(*model, {{"sig_rate", 1.0}}, {}));

  // a new dataset invalidates the fit again
  model->SetDataFromToyMC(model->parameters().Defaults(), rng);
  EXPECT_THROW(plr.Evaluate(*model, {{"sig_rate", 1.0}}, {}), StaleFitError);
}

TEST_F(StatisticTest, GrowsAwayFromTheMaximum) {
  ProfileLikelihoodRatio plr(FitSettings{});
  const double s_hat = model_->GlobalFit().params.at("sig_rate");

  double prev = plr.Evaluate(*model_, {{"sig_rate", s_hat + 10.0}}, {});
  EXPECT_GT(prev, 0.0);
  for (double s : {s_hat + 20.0, s_hat + 40.0, s_hat + 70.0}) {
    const double t = plr.Evaluate(*model_, {{"sig_rate", s}}, {});
    EXPECT_GT(t, prev) << "sig_rate=" << s;
    prev = t;
  }
  EXPECT_GT(prev, 5.0);
}

TEST_F(StatisticTest, NonNegativeAtRandomHypotheses) {
  ProfileLikelihoodRatio plr(FitSettings{});
  std::mt19937_64 rng(17);
  std::uniform_real_distribution<double> pick(0.0, 60.0);
  for (int i = 0; i < 20; ++i) {
    const double s = pick(rng);
    const auto r = plr.Compute(*model_, {{"sig_rate", s}}, {{"lg_bkg", 0.0}});
    EXPECT_GE(r.t, -1e-3) << "sig_rate=" << s;
    EXPECT_FALSE(r.negative);
    EXPECT_DOUBLE_EQ(r.global_loglik, model_->GlobalFit().max_loglik);
  }
}

TEST_F(StatisticTest, ZeroAtTheGlobalMaximum) {
  ProfileLikelihoodRatio plr(FitSettings{});
  const auto& g = model_->GlobalFit();
  const double t = plr.Evaluate(*model_, {{"sig_rate", g.params.at("sig_rate")}}, {});
  EXPECT_NEAR(t, 0.0, 1e-2);
}

TEST_F(StatisticTest, UnknownHypothesisParameterIsRejected) {
  ProfileLikelihoodRatio plr(FitSettings{});
  EXPECT_THROW(plr.Evaluate(*model_, {{"wimp_mass", 1.0}}, {}), InvalidParameter);
}

TEST_F(StatisticTest, OneSidedIgnoresDownwardHypotheses) {
  OneSidedProfileLikelihoodRatio q("sig_rate", FitSettings{});
  const double s_hat = model_->GlobalFit().params.at("sig_rate");
  if (s_hat > 1.0) {
    EXPECT_DOUBLE_EQ(q.Evaluate(*model_, {{"sig_rate", 0.5 * s_hat}}, {}), 0.0);
  }
  ProfileLikelihoodRatio plr(FitSettings{});
  const ParameterVector up{{"sig_rate", s_hat + 30.0}};
  EXPECT_NEAR(q.Evaluate(*model_, up, {}), plr.Evaluate(*model_, up, {}), 1e-6);
  EXPECT_THROW(q.Evaluate(*model_, {{"lg_bkg", 0.0}}, {}), MissingParameter);
}

TEST(ProfileLikelihoodRatio, NegativeValueIsReportedNotClipped) {
  // 50 events: ln L peaks at mu = 50
  auto model = test::MakeSingleSourceModel();
  model->SetData(Dataset(50, Event{{5.0}, -1}));

  // a loose global fit started far below stops short of the maximum
  FitSettings loose;
  loose.tolerance = 1e8;
  loose.strategy = 0;
  loose.compute_curvature = false;
  model->SetFitSettings(loose);
  const auto& global = model->SetMaxLogLikelihood({{"mu", 0.5}});
  ASSERT_GT(std::abs(global.params.at("mu") - 50.0), 1.0) << "global fit reached the maximum";

  ProfileLikelihoodRatio plr(FitSettings{});
  const auto r = plr.Compute(*model, {{"mu", 50.0}}, {});
  const double expected = -2.0 * (model->Evaluate({{"mu", 50.0}}) - global.max_loglik);
  EXPECT_LT(r.t, 0.0);
  EXPECT_TRUE(r.negative);
  EXPECT_DOUBLE_EQ(r.t, expected);
  EXPECT_DOUBLE_EQ(r.global_loglik, global.max_loglik);

  // a proper refit restores t >= 0
  model->SetFitSettings(FitSettings{});
  model->SetMaxLogLikelihood({{"mu", 0.5}});
  const auto again = plr.Compute(*model, {{"mu", 50.0}}, {});
  EXPECT_GE(again.t, -1e-3);
  EXPECT_FALSE(again.negative);
}

TEST(TestStatisticFactory, SelectsByName) {
  stats::StatisticsConfig cfg;
  EXPECT_EQ(stats::MakeTestStatistic(cfg)->Name(), "PLR");

  cfg.test_stat = "plr_onesided";
  EXPECT_THROW(stats::MakeTestStatistic(cfg), std::invalid_argument);
  cfg.poi = "sig_rate";
  EXPECT_EQ(stats::MakeTestStatistic(cfg)->Name(), "PLR_ONESIDED");

  cfg.test_stat = "CLs";
  EXPECT_EQ(stats::MakeTestStatistic(cfg)->Name(), "PLR");
}
