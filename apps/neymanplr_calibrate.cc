#include "neymanplr/calibration/NeymanCalibrator.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/io/ConfigManager.hh"
#include "neymanplr/io/DatasetIO.hh"
#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/model/ModelBuilder.hh"
#include "neymanplr/stats/TestStatisticFactory.hh"
#include "neymanplr/templates/TemplateStore.hh"

#include <TFile.h>
#include <TGraph.h>
#include <TH1D.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>

// Neyman construction: for each hypothesis point, the distribution of t under
// toys drawn at that hypothesis, one histogram per point. With a dataset,
// also reports which hypotheses are inside the confidence set.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: neymanplr_calibrate <config.json> [data.csv]\n";
    return 1;
  }

  try {
    neymanplr::ConfigManager cfg(argv[1]);
    cfg.parse();
    const auto& run = cfg.run();
    const auto& cal = cfg.calibration();

    neymanplr::TemplateStore store(cfg.templates().base_dir, cfg.templates().root_file);
    neymanplr::ModelBuilder builder(cfg, store);
    // first build loads templates and terms; later builds only share them
    auto model = builder.Build();
    if (run.verbosity > 0) std::cout << model->View() << "\n";

    std::shared_ptr<const neymanplr::stats::ITestStatistic> statistic =
        neymanplr::stats::MakeTestStatistic(cfg.statistics());

    neymanplr::CalibrationConfig ccfg;
    ccfg.n_toys       = cal.n_toys;
    ccfg.n_threads    = run.n_threads;
    ccfg.rng_seed     = run.rng_seed;
    ccfg.true_params  = cal.true_params;
    ccfg.global_guess = cal.global_guess;
    ccfg.hypotheses   = cal.hypotheses;
    ccfg.verbosity    = run.verbosity;

    // observed statistic per hypothesis (NaN where the fit failed)
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> t_obs;
    if (argc > 2) {
      const int ndim = model->sources() ? model->sources()->ndim() : 0;
      model->SetData(neymanplr::LoadDatasetCSV(argv[2], ndim));
      model->SetMaxLogLikelihood(cal.global_guess.empty() ? model->parameters().Defaults() : cal.global_guess);

      for (auto& h : ccfg.hypotheses) {
        try {
          const auto r = statistic->Compute(*model, h.theta_fixed, h.phi_guess);
          t_obs.push_back(r.t);
          // toys for this hypothesis use the nuisances that best fit the data there
          if (cal.phi_from_data && h.phi_true.empty() && !r.profiled.params.empty()) {
            for (const auto& [name, value] : r.profiled.params)
              if (!h.theta_fixed.count(name)) h.phi_true[name] = value;
          }
        } catch (const neymanplr::ConvergenceFailure& e) {
          t_obs.push_back(nan);
          std::cerr << "[stats] WARNING: '" << h.label << "' on observed data skipped: " << e.what() << "\n";
        }
      }
    }

    neymanplr::NeymanCalibrator calib([&builder] { return builder.Build(); }, statistic, ccfg);
    const auto results = calib.Run();

    if (!run.outdir.empty()) std::filesystem::create_directories(run.outdir);
    const std::string outpath = (run.outdir.empty() ? std::string(".") : run.outdir) + "/calibration.root";
    TFile fout(outpath.c_str(), "RECREATE");

    std::vector<double> idx, tcrit;
    std::cout << "\n[toymc] critical values at CL = " << cal.cl << "\n";
    for (std::size_t h = 0; h < results.size(); ++h) {
      const auto& r = results[h];
      if (r.t_values.empty()) {
        std::cerr << "[toymc] WARNING: '" << r.hypothesis.label << "': every toy failed\n";
        continue;
      }
      const double q = r.Quantile(cal.cl);
      idx.push_back(static_cast<double>(h));
      tcrit.push_back(q);

      std::cout << "  " << r.hypothesis.label << " : t_crit = " << q;
      if (!t_obs.empty()) {
        if (std::isnan(t_obs[h])) {
          std::cout << "  t_obs = n/a (fit failed)";
        } else {
          std::cout << "  t_obs = " << t_obs[h] << "  p = " << r.PValue(t_obs[h])
                    << (t_obs[h] <= q ? "  [accepted]" : "  [excluded]");
        }
      }
      std::cout << "\n";

      const double tmax = std::max(1.0, *std::max_element(r.t_values.begin(), r.t_values.end()));
      TH1D ht(("t_" + std::to_string(h)).c_str(),
              (r.hypothesis.label + ";t;toys").c_str(), 100, 0.0, tmax * 1.05);
      for (double t : r.t_values) ht.Fill(t);
      ht.Write();
    }

    TGraph gq(static_cast<int>(idx.size()), idx.data(), tcrit.data());
    gq.SetName("t_crit");
    gq.SetTitle("critical value;hypothesis index;t_{crit}");
    gq.Write();
    fout.Close();

    std::cout << "\n[output] calibration written to: " << outpath << "\n";
    return 0;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  }
}
