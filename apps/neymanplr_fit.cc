#include "neymanplr/core/Errors.hh"
#include "neymanplr/io/ConfigManager.hh"
#include "neymanplr/io/DatasetIO.hh"
#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/model/ModelBuilder.hh"
#include "neymanplr/stats/TestStatisticFactory.hh"
#include "neymanplr/templates/TemplateStore.hh"

#include <TFile.h>
#include <TGraph.h>

#include <filesystem>
#include <iostream>
#include <vector>

// Fit one dataset and scan the test statistic over the configured grid.
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: neymanplr_fit <config.json> <data.csv>\n";
    return 1;
  }

  try {
    neymanplr::ConfigManager cfg(argv[1]);
    cfg.parse();
    const auto& run = cfg.run();

    std::cout << "[neymanplr] Run: " << run.label << "\n";

    neymanplr::TemplateStore store(cfg.templates().base_dir, cfg.templates().root_file);
    neymanplr::ModelBuilder builder(cfg, store);
    auto model = builder.Build();

    const int ndim = model->sources() ? model->sources()->ndim() : 0;
    model->SetData(neymanplr::LoadDatasetCSV(argv[2], ndim));
    std::cout << "  Events: " << model->data().size() << " from " << argv[2] << "\n\n";
    std::cout << model->View() << "\n";

    const auto guess = model->parameters().Defaults();
    const auto& global = model->SetMaxLogLikelihood(guess);
    std::cout << "[fit] global maximum lnL = " << global.max_loglik
              << " at " << neymanplr::ToString(global.params) << "\n";
    for (const auto& kv : global.errors)
      std::cout << "    " << kv.first << " = " << global.params.at(kv.first) << " +- " << kv.second << "\n";
    if (global.flat_likelihood)
      std::cout << "[fit] WARNING: likelihood is flat in some parameter(s); see stderr\n";
    if (global.hesse_failed)
      std::cout << "[fit] WARNING: Hesse failed, no errors or curvature check\n";
    for (const auto& p : global.at_bound)
      std::cout << "    " << p << " is at a bound\n";

    const auto& scan = cfg.scan();
    if (scan.param.empty() || scan.values.empty()) {
      std::cout << "[stats] no scan configured\n";
      return 0;
    }

    auto statistic = neymanplr::stats::MakeTestStatistic(cfg.statistics());
    std::vector<double> xs, ts;
    for (double v : scan.values) {
      neymanplr::ParameterVector theta{{scan.param, v}};
      try {
        const double t = statistic->Evaluate(*model, theta, {});
        xs.push_back(v);
        ts.push_back(t);
        std::cout << "[stats] " << scan.param << " = " << v << "  t = " << t << "\n";
      } catch (const neymanplr::ConvergenceFailure& e) {
        std::cerr << "[stats] WARNING: " << scan.param << " = " << v << " skipped: " << e.what() << "\n";
      }
    }

    if (!run.outdir.empty()) std::filesystem::create_directories(run.outdir);
    const std::string outpath = (run.outdir.empty() ? std::string(".") : run.outdir) + "/fit_scan.root";
    TFile fout(outpath.c_str(), "RECREATE");
    TGraph g(static_cast<int>(xs.size()), xs.data(), ts.data());
    g.SetName(("t_vs_" + scan.param).c_str());
    g.SetTitle((statistic->Name() + ";" + scan.param + ";t").c_str());
    g.Write();
    fout.Close();

    std::cout << "\n[output] scan written to: " << outpath << "\n";
    return 0;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  }
}
