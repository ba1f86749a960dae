#include <gtest/gtest.h>

#include "TestHelpers.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/model/SourceModel.hh"
#include "neymanplr/simulate/ToyMCSimulator.hh"

#include <cmath>
#include <random>
#include <stdexcept>

using namespace neymanplr;

namespace {

std::shared_ptr<const SourceModel> sources() {
  auto sm = std::make_shared<SourceModel>();
  sm->AddSource({"bkg", "bkg", "lg_bkg", RateTransform::Log10}, test::MakeFlatTemplate("bkg", 0.0, 10.0, 10, 30.0));
  sm->AddSource({"sig", "sig", "sig_rate", RateTransform::Linear},
                test::MakePeakTemplate("sig", 4.0, 6.0, 10, 5.0, 0.3, 1.0));
  return sm;
}

} // namespace

TEST(ToyMCSimulator, CountsFollowExpectation) {
  ToyMCSimulator sim(sources());
  const ParameterVector truth{{"lg_bkg", 0.0}, {"sig_rate", 10.0}};   // mu = 30 + 10
  std::mt19937_64 rng(3);

  const int ntoys = 400;
  double sum_n = 0.0, sum_sig = 0.0;
  for (int i = 0; i < ntoys; ++i) {
    const auto d = sim.Simulate(truth, rng);
    sum_n += static_cast<double>(d.size());
    for (const auto& ev : d) {
      ASSERT_TRUE(ev.source == 0 || ev.source == 1);
      ASSERT_EQ(ev.x.size(), 1u);
      if (ev.source == 1) {
        ++sum_sig;
        EXPECT_GE(ev.x[0], 4.0);
        EXPECT_LE(ev.x[0], 6.0);
      }
    }
  }
  // mean 40, standard error of the mean sqrt(40/400) ~ 0.32
  EXPECT_NEAR(sum_n / ntoys, 40.0, 1.5);
  EXPECT_NEAR(sum_sig / ntoys, 10.0, 0.8);
}

TEST(ToyMCSimulator, SameSeedSameToy) {
  ToyMCSimulator sim(sources());
  const ParameterVector truth{{"lg_bkg", 0.0}, {"sig_rate", 5.0}};
  std::mt19937_64 a(42), b(42);
  const auto da = sim.Simulate(truth, a);
  const auto db = sim.Simulate(truth, b);
  ASSERT_EQ(da.size(), db.size());
  for (std::size_t i = 0; i < da.size(); ++i) {
    EXPECT_EQ(da[i].x, db[i].x);
    EXPECT_EQ(da[i].source, db[i].source);
  }
}

TEST(ToyMCSimulator, ZeroExpectationGivesEmptyDataset) {
  auto sm = std::make_shared<SourceModel>();
  sm->AddSource({"sig", "sig", "sig_rate", RateTransform::Linear}, test::MakeFlatTemplate("sig", 0, 1, 2, 1.0));
  ToyMCSimulator sim(sm);
  std::mt19937_64 rng(1);
  EXPECT_TRUE(sim.Simulate({{"sig_rate", 0.0}}, rng).empty());
}

TEST(ToyMCSimulator, BadTruthIsRejected) {
  ToyMCSimulator sim(sources());
  std::mt19937_64 rng(1);
  EXPECT_THROW(sim.Simulate({{"lg_bkg", 0.0}}, rng), MissingParameter);
  EXPECT_THROW(sim.Simulate({{"lg_bkg", 0.0}, {"sig_rate", -2.0}}, rng), InvalidParameter);
  EXPECT_THROW(ToyMCSimulator(nullptr), std::invalid_argument);
}

TEST(ToyMCSimulator, ToyEventsHavePositiveLikelihoodDensity) {
  // every simulated event must be possible under the model that generated it
  auto sm = sources();
  ToyMCSimulator sim(sm);
  std::mt19937_64 rng(8);
  const auto d = sim.Simulate({{"lg_bkg", 0.5}, {"sig_rate", 20.0}}, rng);
  for (const auto& ev : d) {
    EXPECT_GT(sm->source(static_cast<std::size_t>(ev.source)).tmpl->Density(ev.x), 0.0);
  }
}
