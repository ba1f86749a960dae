#include "neymanplr/calibration/NeymanCalibrator.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/core/Log.hh"
#include "neymanplr/model/LikelihoodModel.hh"

#include <TROOT.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

namespace neymanplr {

namespace {

std::mt19937_64 toy_rng(std::uint64_t seed, std::size_t hyp, int toy) {
  std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffULL),
                    static_cast<std::uint32_t>(seed >> 32),
                    static_cast<std::uint32_t>(hyp),
                    static_cast<std::uint32_t>(toy)};
  return std::mt19937_64(seq);
}

} // namespace

ParameterVector GenerationPoint(const CalibrationConfig& cfg, const HypothesisPoint& h) {
  ParameterVector p = cfg.true_params;
  for (const auto& [name, value] : h.phi_true)    p[name] = value;
  for (const auto& [name, value] : h.theta_fixed) p[name] = value;
  return p;
}

double CalibrationResult::Quantile(double p) const {
  if (t_values.empty()) throw std::runtime_error("Quantile: no toys for '" + hypothesis.label + "'");
  if (!(p >= 0.0 && p <= 1.0)) throw std::invalid_argument("Quantile: p must be in [0,1]");

  std::vector<double> s = t_values;
  std::sort(s.begin(), s.end());
  const double h = p * static_cast<double>(s.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(h));
  const std::size_t hi = std::min(lo + 1, s.size() - 1);
  return s[lo] + (h - static_cast<double>(lo)) * (s[hi] - s[lo]);
}

double CalibrationResult::PValue(double t_obs) const {
  if (t_values.empty()) throw std::runtime_error("PValue: no toys for '" + hypothesis.label + "'");
  const auto n_ge = std::count_if(t_values.begin(), t_values.end(),
                                  [&](double t) { return t >= t_obs; });
  return static_cast<double>(n_ge) / static_cast<double>(t_values.size());
}

NeymanCalibrator::NeymanCalibrator(ModelFactory factory,
                                   std::shared_ptr<const stats::ITestStatistic> statistic,
                                   CalibrationConfig cfg)
: factory_(std::move(factory)), statistic_(std::move(statistic)), cfg_(std::move(cfg))
{
  if (!factory_)   throw std::invalid_argument("NeymanCalibrator: no model factory");
  if (!statistic_) throw std::invalid_argument("NeymanCalibrator: no test statistic");
  if (cfg_.n_toys <= 0) throw std::invalid_argument("calibration.n_toys must be > 0");
  if (cfg_.n_threads <= 0) throw std::invalid_argument("run.n_threads must be > 0");
  if (cfg_.hypotheses.empty()) throw std::invalid_argument("calibration: no hypothesis points");
}

void NeymanCalibrator::RunWorker_(int worker, int n_workers,
                                  std::vector<std::vector<double>>& t_by_hyp,
                                  std::vector<std::vector<char>>& failed_by_hyp,
                                  std::vector<std::vector<char>>& negative_by_hyp) const {
  auto model = factory_();
  if (!model) throw std::runtime_error("NeymanCalibrator: model factory returned null");

  // one line per toy fit only in debug mode
  FitSettings fs = model->fit_settings();
  if (cfg_.verbosity < 2) fs.verbosity = 0;
  model->SetFitSettings(fs);

  const std::size_t nh = cfg_.hypotheses.size();
  std::vector<ParameterVector> truth(nh);
  for (std::size_t h = 0; h < nh; ++h) truth[h] = GenerationPoint(cfg_, cfg_.hypotheses[h]);

  const int report_every = std::max(1, cfg_.n_toys / 10);

  for (int toy = worker; toy < cfg_.n_toys; toy += n_workers) {
    const auto i = static_cast<std::size_t>(toy);

    for (std::size_t h = 0; h < nh; ++h) {
      const auto& hyp = cfg_.hypotheses[h];
      auto rng = toy_rng(cfg_.rng_seed, h, toy);
      model->SetDataFromToyMC(truth[h], rng);

      try {
        model->SetMaxLogLikelihood(cfg_.global_guess.empty() ? truth[h] : cfg_.global_guess);
      } catch (const ConvergenceFailure& e) {
        failed_by_hyp[h][i] = 1;
        if (cfg_.verbosity > 1) {
          std::lock_guard<std::mutex> lk(LogMutex());
          std::cerr << "[toymc] toy " << toy << ", hypothesis '" << hyp.label
                    << "': global fit failed: " << e.what() << "\n";
        }
        continue;
      }

      try {
        const auto r = statistic_->Compute(*model, hyp.theta_fixed, hyp.phi_guess);
        t_by_hyp[h][i] = r.t;
        negative_by_hyp[h][i] = r.negative ? 1 : 0;
      } catch (const ConvergenceFailure& e) {
        failed_by_hyp[h][i] = 1;
        if (cfg_.verbosity > 1) {
          std::lock_guard<std::mutex> lk(LogMutex());
          std::cerr << "[toymc] toy " << toy << ", hypothesis '" << hyp.label
                    << "': profiled fit failed: " << e.what() << "\n";
        }
      }
    }

    if (cfg_.verbosity > 0 && (toy + 1) % report_every == 0) {
      std::lock_guard<std::mutex> lk(LogMutex());
      std::cout << "[toymc] toy " << (toy + 1) << " / " << cfg_.n_toys << "\n";
    }
  }
}

std::vector<CalibrationResult> NeymanCalibrator::Run() const {
  const std::size_t nh = cfg_.hypotheses.size();
  const auto nt = static_cast<std::size_t>(cfg_.n_toys);

  std::vector<std::vector<double>> t_by_hyp(nh, std::vector<double>(nt, std::numeric_limits<double>::quiet_NaN()));
  std::vector<std::vector<char>>   failed_by_hyp(nh, std::vector<char>(nt, 0));
  std::vector<std::vector<char>>   negative_by_hyp(nh, std::vector<char>(nt, 0));

  const int n_workers = std::min(cfg_.n_threads, cfg_.n_toys);
  if (cfg_.verbosity > 0) {
    std::cout << "[toymc] " << cfg_.n_toys << " toys per hypothesis, " << nh
              << " hypothesis point(s), nuisances from " << ToString(cfg_.true_params)
              << ", " << n_workers << " worker(s)\n";
  }

  if (n_workers == 1) {
    RunWorker_(0, 1, t_by_hyp, failed_by_hyp, negative_by_hyp);
  } else {
    ROOT::EnableThreadSafety();

    std::vector<std::thread> pool;
    std::vector<std::exception_ptr> errors(static_cast<std::size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
      pool.emplace_back([&, w] {
        try {
          RunWorker_(w, n_workers, t_by_hyp, failed_by_hyp, negative_by_hyp);
        } catch (...) {
          errors[static_cast<std::size_t>(w)] = std::current_exception();
        }
      });
    }
    for (auto& th : pool) th.join();
    for (const auto& e : errors)
      if (e) std::rethrow_exception(e);
  }

  std::vector<CalibrationResult> out(nh);
  for (std::size_t h = 0; h < nh; ++h) {
    auto& r = out[h];
    r.hypothesis = cfg_.hypotheses[h];
    r.truth      = GenerationPoint(cfg_, r.hypothesis);
    for (std::size_t i = 0; i < nt; ++i) {
      if (failed_by_hyp[h][i]) { ++r.n_failed_fits; continue; }
      r.t_values.push_back(t_by_hyp[h][i]);
      if (negative_by_hyp[h][i]) ++r.n_negative;
    }
    if (cfg_.verbosity > 0) {
      std::cout << "[toymc] '" << r.hypothesis.label << "' (toys at " << ToString(r.truth) << "): "
                << r.t_values.size() << " toys, "
                << r.n_failed_fits << " failed fit(s), " << r.n_negative << " negative t\n";
    }
  }
  return out;
}

} // namespace neymanplr
