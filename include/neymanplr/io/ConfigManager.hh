#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "neymanplr/calibration/NeymanCalibrator.hh"
#include "neymanplr/core/Parameters.hh"
#include "neymanplr/fit/FitSettings.hh"
#include "neymanplr/model/SourceModel.hh"
#include "neymanplr/stats/StatisticsConfig.hh"

namespace neymanplr {

struct RunHeader {
  std::string label;
  std::string outdir;
  uint64_t    rng_seed  = 12345;
  int         verbosity = 1;
  int         n_threads = 1;
};

struct TemplatesJSON {
  std::string base_dir;    // e.g. data/templates
  std::string root_file;   // optional, e.g. templates.root; empty -> <name>.csv files
};

struct ConstraintJSON {
  std::string param;
  double      mean  = 0.0;
  double      sigma = 1.0;
};

struct ScanJSON {
  std::string         param;    // parameter of interest to scan
  std::vector<double> values;
};

struct CalibrationJSON {
  int             n_toys = 0;
  double          cl = 0.90;
  ParameterVector true_params;
  ParameterVector global_guess;           // empty -> each toy's truth
  bool            phi_from_data = true;   // with observed data: toys use the conditional fit's Φ
  std::vector<HypothesisPoint> hypotheses;
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();

  /// Parse an already-loaded document (used by tests and by parse()).
  void parse(const nlohmann::json& j);

  const RunHeader&                  run()         const noexcept { return run_; }
  const TemplatesJSON&              templates()   const noexcept { return templates_; }
  const std::vector<ParameterSpec>& parameters()  const noexcept { return params_; }
  const std::vector<SourceSpec>&    sources()     const noexcept { return sources_; }
  const std::vector<ConstraintJSON>& constraints() const noexcept { return constraints_; }
  const std::vector<std::string>&   counting()    const noexcept { return counting_; }
  const FitSettings&                fit()         const noexcept { return fit_; }
  const stats::StatisticsConfig&    statistics()  const noexcept { return stats_; }
  const ScanJSON&                   scan()        const noexcept { return scan_; }
  const CalibrationJSON&            calibration() const noexcept { return calib_; }

  /// Registry built from the "parameters" block.
  ParameterRegistry MakeRegistry() const;

private:
  std::string path_;
  RunHeader   run_;
  TemplatesJSON templates_;
  std::vector<ParameterSpec>  params_;
  std::vector<SourceSpec>     sources_;
  std::vector<ConstraintJSON> constraints_;
  std::vector<std::string>    counting_;
  FitSettings                 fit_;
  stats::StatisticsConfig     stats_;
  ScanJSON                    scan_;
  CalibrationJSON             calib_;

  void parse_run_(const nlohmann::json& j);
  void parse_templates_(const nlohmann::json& j);
  void parse_parameters_(const nlohmann::json& j);
  void parse_sources_(const nlohmann::json& j);
  void parse_constraints_(const nlohmann::json& j);
  void parse_counting_(const nlohmann::json& j);
  void parse_fit_(const nlohmann::json& j);
  void parse_statistics_(const nlohmann::json& j);
  void parse_scan_(const nlohmann::json& j);
  void parse_calibration_(const nlohmann::json& j);
};

/// Axis values from {"values": [...]}, {"linspace": {start, stop, num}},
/// {"logspace": {start_exp, stop_exp, num}} or a plain array; duplicates dropped.
std::vector<double> ExpandAxis(const nlohmann::json& spec, const std::string& kind);

} // namespace neymanplr
