#include <gtest/gtest.h>

#include "TestHelpers.hh"
#include "neymanplr/io/ConfigManager.hh"
#include "neymanplr/io/DatasetIO.hh"
#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/model/ModelBuilder.hh"
#include "neymanplr/templates/TemplateStore.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace neymanplr;
namespace fs = std::filesystem;

namespace {

nlohmann::json minimal_config() {
  return nlohmann::json::parse(R"({
    "run": { "label": "unit", "outdir": "out", "rng_seed": 5, "verbosity": 0, "n_threads": 2 },
    "templates": { "base_dir": "tmpl" },
    "parameters": [
      { "name": "lg_bkg",   "default": 0.0, "lower": -2, "upper": 2 },
      { "name": "sig_rate", "default": 1.0, "lower": 0, "upper": 100, "role": "interesting" }
    ],
    "sources": [
      { "name": "bkg", "rate_param": "lg_bkg" },
      { "name": "sig", "template": "sig_peak", "rate_param": "sig_rate", "transform": "linear" }
    ],
    "constraints": [ { "param": "lg_bkg", "sigma": 0.1 } ],
    "fit": { "max_function_calls": 5000, "tolerance": 0.05 },
    "statistics": { "test_stat": "PLR_ONESIDED", "poi": "sig_rate" },
    "scan": { "param": "sig_rate", "values": { "linspace": { "start": 0, "stop": 20, "num": 5 } } },
    "calibration": {
      "n_toys": 50, "cl": 0.95,
      "true_params": { "lg_bkg": 0.0, "sig_rate": 5.0 },
      "phi_guess": { "lg_bkg": 0.0 },
      "phi_from_data": false,
      "hypotheses": [ { "label": "s5", "theta": { "sig_rate": 5.0 },
                        "phi_true": { "lg_bkg": 0.2 } } ],
      "scan": { "param": "sig_rate", "values": [10, 20, 10] }
    }
  })");
}

fs::path temp_file(const std::string& name) {
  return fs::temp_directory_path() / ("neymanplr_io_" + name);
}

} // namespace

TEST(ConfigManager, ParsesAllBlocks) {
  ConfigManager cfg("in-memory");
  cfg.parse(minimal_config());

  EXPECT_EQ(cfg.run().label, "unit");
  EXPECT_EQ(cfg.run().rng_seed, 5u);
  EXPECT_EQ(cfg.run().n_threads, 2);
  EXPECT_EQ(cfg.templates().base_dir, "tmpl");
  EXPECT_TRUE(cfg.templates().root_file.empty());

  ASSERT_EQ(cfg.parameters().size(), 2u);
  EXPECT_EQ(cfg.parameters()[1].role, ParameterRole::Interesting);
  EXPECT_DOUBLE_EQ(cfg.parameters()[1].upper, 100.0);

  ASSERT_EQ(cfg.sources().size(), 2u);
  EXPECT_EQ(cfg.sources()[0].template_name, "bkg");
  EXPECT_EQ(cfg.sources()[0].transform, RateTransform::Log10);
  EXPECT_EQ(cfg.sources()[1].template_name, "sig_peak");
  EXPECT_EQ(cfg.sources()[1].transform, RateTransform::Linear);

  ASSERT_EQ(cfg.constraints().size(), 1u);
  EXPECT_DOUBLE_EQ(cfg.constraints()[0].mean, 0.0);

  EXPECT_EQ(cfg.fit().max_function_calls, 5000);
  EXPECT_DOUBLE_EQ(cfg.statistics().fit.tolerance, 0.05);
  EXPECT_EQ(cfg.statistics().poi, "sig_rate");

  EXPECT_EQ(cfg.scan().values, (std::vector<double>{0, 5, 10, 15, 20}));

  const auto& cal = cfg.calibration();
  EXPECT_EQ(cal.n_toys, 50);
  EXPECT_DOUBLE_EQ(cal.cl, 0.95);
  ASSERT_EQ(cal.hypotheses.size(), 3u);   // one explicit + two distinct scan points
  EXPECT_EQ(cal.hypotheses[0].label, "s5");
  EXPECT_DOUBLE_EQ(cal.hypotheses[0].phi_guess.at("lg_bkg"), 0.0);
  EXPECT_DOUBLE_EQ(cal.hypotheses[2].theta_fixed.at("sig_rate"), 20.0);
  EXPECT_EQ(cal.hypotheses[1].label, "sig_rate=10");
  EXPECT_FALSE(cal.phi_from_data);
  EXPECT_TRUE(cal.global_guess.empty());
  EXPECT_DOUBLE_EQ(cal.hypotheses[0].phi_true.at("lg_bkg"), 0.2);
  EXPECT_TRUE(cal.hypotheses[1].phi_true.empty());
}

TEST(ConfigManager, RejectsBadValues) {
  auto j = minimal_config();
  j["parameters"][0]["role"] = "signal";
  EXPECT_THROW(ConfigManager("x").parse(j), std::invalid_argument);

  j = minimal_config();
  j["fit"]["tolerance"] = 0.0;
  EXPECT_THROW(ConfigManager("x").parse(j), std::invalid_argument);

  j = minimal_config();
  j["calibration"]["cl"] = 1.5;
  EXPECT_THROW(ConfigManager("x").parse(j), std::invalid_argument);

  j = minimal_config();
  j.erase("parameters");
  EXPECT_THROW(ConfigManager("x").parse(j), nlohmann::json::exception);

  EXPECT_THROW(ConfigManager("/nonexistent/neymanplr.json").parse(), std::runtime_error);
}

TEST(ConfigManager, UnboundedParameters) {
  auto j = minimal_config();
  j["parameters"][0].erase("lower");
  j["parameters"][0]["upper"] = nullptr;
  ConfigManager cfg("x");
  cfg.parse(j);
  EXPECT_FALSE(cfg.parameters()[0].has_lower());
  EXPECT_FALSE(cfg.parameters()[0].has_upper());
}

TEST(ExpandAxis, GridForms) {
  EXPECT_EQ(ExpandAxis(nlohmann::json::parse("[1, 2, 2, 3]"), "a"), (std::vector<double>{1, 2, 3}));
  const auto lg = ExpandAxis(nlohmann::json::parse(R"({"logspace": {"start_exp": 0, "stop_exp": 2, "num": 3}})"), "a");
  ASSERT_EQ(lg.size(), 3u);
  EXPECT_NEAR(lg[2], 100.0, 1e-9);
  const auto open = ExpandAxis(
      nlohmann::json::parse(R"({"linspace": {"start": 0, "stop": 1, "num": 4, "endpoint": false}})"), "a");
  EXPECT_NEAR(open.back(), 0.75, 1e-12);
  EXPECT_THROW(ExpandAxis(nlohmann::json(3.0), "a"), std::runtime_error);
}

TEST(ModelBuilder, AssemblesTermsFromConfig) {
  ConfigManager cfg("x");
  cfg.parse(minimal_config());

  TemplateStore store("unused");
  store.Put(test::MakeFlatTemplate("bkg", 0.0, 10.0, 10, 50.0));
  store.Put(test::MakePeakTemplate("sig_peak", 0.0, 10.0, 20, 5.0, 0.5, 1.0));

  ModelBuilder builder(cfg, store);
  auto model = builder.Build();
  ASSERT_EQ(model->terms().size(), 3u);
  EXPECT_EQ(model->terms()[0]->Kind(), "PoissonCount");
  EXPECT_EQ(model->terms()[1]->Kind(), "MixtureDensity");
  EXPECT_EQ(model->terms()[2]->Name(), "constraint_lg_bkg");
  EXPECT_EQ(model->fit_settings().max_function_calls, 5000);

  // second model shares terms and sources, not state
  auto other = builder.Build();
  EXPECT_EQ(other->sources().get(), model->sources().get());
  model->SetData(Dataset{Event{{1.0}, -1}});
  EXPECT_TRUE(other->data().empty());
}

TEST(ModelBuilder, CountingOnlyConfig) {
  auto j = nlohmann::json::parse(R"({
    "run": { "verbosity": 0 },
    "parameters": [ { "name": "rate", "default": 5, "lower": 0 } ],
    "counting": [ { "param": "rate" } ]
  })");
  ConfigManager cfg("x");
  cfg.parse(j);
  TemplateStore store(".");
  auto model = ModelBuilder(cfg, store).Build();
  EXPECT_FALSE(model->sources());
  EXPECT_NEAR(model->Evaluate({{"rate", 5.0}}), -5.0, 1e-12);
}

TEST(DatasetIO, ReadsCommentsHeaderAndSeparators) {
  const auto path = temp_file("read.csv");
  {
    std::ofstream out(path);
    out << "# two features\n"
        << "x, y\n"
        << "1.0, 2.0\n"
        << "3.5\t4.5\n"
        << "\n"
        << "5 6\n";
  }
  const auto d = LoadDatasetCSV(path.string());
  ASSERT_EQ(d.size(), 3u);
  EXPECT_EQ(d[1].x, (std::vector<double>{3.5, 4.5}));
  EXPECT_EQ(d[2].source, -1);

  EXPECT_THROW(LoadDatasetCSV(path.string(), 1), std::runtime_error);
  fs::remove(path);
}

TEST(DatasetIO, WriteThenRead) {
  const auto path = temp_file("write.csv");
  Dataset d{Event{{0.25}, 0}, Event{{7.125}, 1}};
  WriteDatasetCSV(path.string(), d);
  const auto back = LoadDatasetCSV(path.string(), 1);
  ASSERT_EQ(back.size(), 2u);
  EXPECT_DOUBLE_EQ(back[1].x[0], 7.125);

  WriteDatasetCSV(path.string(), d, /*with_source=*/true);
  // the label does not become a feature, so the file still fits a 1D model
  const auto labelled = LoadDatasetCSV(path.string(), 1);
  ASSERT_EQ(labelled.size(), 2u);
  EXPECT_EQ(labelled[1].x, (std::vector<double>{7.125}));
  EXPECT_EQ(labelled[0].source, 0);
  EXPECT_EQ(labelled[1].source, 1);
  fs::remove(path);

  EXPECT_THROW(LoadDatasetCSV("/nonexistent/data.csv"), std::runtime_error);
}
