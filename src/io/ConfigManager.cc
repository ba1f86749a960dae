#include "neymanplr/io/ConfigManager.hh"
#include <cmath>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace neymanplr {

namespace {

double bound_or(const nlohmann::json& j, const char* key, double fallback) {
  if (!j.contains(key) || j.at(key).is_null()) return fallback;
  return j.at(key).get<double>();
}

ParameterVector parse_param_map(const nlohmann::json& j) {
  ParameterVector out;
  for (auto it = j.begin(); it != j.end(); ++it) out[it.key()] = it.value().get<double>();
  return out;
}

std::string point_label(const ParameterVector& theta) {
  std::ostringstream os;
  bool first = true;
  for (const auto& [k, v] : theta) {
    if (!first) os << ",";
    os << k << "=" << v;
    first = false;
  }
  return os.str();
}

} // namespace

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  parse_run_(j.at("run"));
  if (j.contains("templates"))   parse_templates_(j.at("templates"));
  parse_parameters_(j.at("parameters"));
  if (j.contains("sources"))     parse_sources_(j.at("sources"));
  if (j.contains("constraints")) parse_constraints_(j.at("constraints"));
  if (j.contains("counting"))    parse_counting_(j.at("counting"));
  parse_fit_(j.contains("fit") ? j.at("fit") : nlohmann::json::object());
  parse_statistics_(j.contains("statistics") ? j.at("statistics") : nlohmann::json::object());
  if (j.contains("scan"))        parse_scan_(j.at("scan"));
  if (j.contains("calibration")) parse_calibration_(j.at("calibration"));

  if (sources_.empty() && counting_.empty())
    throw std::invalid_argument("config: need at least one source or counting term");
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string{"."});
  run_.rng_seed  = j.value("rng_seed", 12345ULL);
  run_.verbosity = j.value("verbosity", 1);
  run_.n_threads = j.value("n_threads", 1);
  if (run_.n_threads <= 0) throw std::invalid_argument("run.n_threads must be > 0");
}

void ConfigManager::parse_templates_(const nlohmann::json& j) {
  templates_.base_dir  = j.value("base_dir", std::string{"."});
  templates_.root_file = j.value("file", std::string{});
}

void ConfigManager::parse_parameters_(const nlohmann::json& j) {
  if (!j.is_array()) throw std::invalid_argument("parameters must be a list");
  params_.clear();
  for (const auto& jp : j) {
    ParameterSpec s;
    s.name          = jp.at("name").get<std::string>();
    s.default_value = jp.value("default", 0.0);
    s.lower         = bound_or(jp, "lower", -std::numeric_limits<double>::infinity());
    s.upper         = bound_or(jp, "upper",  std::numeric_limits<double>::infinity());
    s.role          = ParseRole(jp.value("role", std::string{"nuisance"}));
    params_.push_back(std::move(s));
  }
}

void ConfigManager::parse_sources_(const nlohmann::json& j) {
  sources_.clear();
  for (const auto& js : j) {
    SourceSpec s;
    s.name          = js.at("name").get<std::string>();
    s.template_name = js.value("template", s.name);
    s.rate_param    = js.at("rate_param").get<std::string>();
    s.transform     = ParseRateTransform(js.value("transform", std::string{"log10"}));
    sources_.push_back(std::move(s));
  }
}

void ConfigManager::parse_constraints_(const nlohmann::json& j) {
  constraints_.clear();
  for (const auto& jc : j) {
    ConstraintJSON c;
    c.param = jc.at("param").get<std::string>();
    c.mean  = jc.value("mean", 0.0);
    c.sigma = jc.at("sigma").get<double>();
    constraints_.push_back(std::move(c));
  }
}

void ConfigManager::parse_counting_(const nlohmann::json& j) {
  counting_.clear();
  for (const auto& jc : j) counting_.push_back(jc.at("param").get<std::string>());
}

void ConfigManager::parse_fit_(const nlohmann::json& j) {
  fit_.minimizer          = j.value("minimizer", std::string("Minuit2"));
  fit_.algorithm          = j.value("algorithm", std::string("Migrad"));
  fit_.max_function_calls = j.value("max_function_calls", 10000);
  fit_.max_iterations     = j.value("max_iterations", fit_.max_function_calls);
  fit_.tolerance          = j.value("tolerance", 0.01);
  fit_.strategy           = j.value("strategy", 1);
  fit_.print_level        = j.value("print_level", 0);
  fit_.compute_curvature  = j.value("compute_curvature", true);
  fit_.flat_curvature_threshold = j.value("flat_curvature_threshold", 1e-6);
  fit_.verbosity          = j.value("verbosity", run_.verbosity);

  if (fit_.max_function_calls <= 0) throw std::invalid_argument("fit.max_function_calls must be > 0");
  if (!(fit_.tolerance > 0.0))      throw std::invalid_argument("fit.tolerance must be > 0");
}

void ConfigManager::parse_statistics_(const nlohmann::json& j) {
  stats_.test_stat          = j.value("test_stat", "PLR");
  stats_.poi                = j.value("poi", std::string{});
  stats_.negative_tolerance = j.value("negative_tolerance", 1e-3);
  stats_.verbosity          = j.value("verbosity", run_.verbosity);
  stats_.fit                = fit_;
}

void ConfigManager::parse_scan_(const nlohmann::json& j) {
  scan_.param  = j.at("param").get<std::string>();
  scan_.values = ExpandAxis(j.at("values"), scan_.param);
}

void ConfigManager::parse_calibration_(const nlohmann::json& j) {
  calib_.n_toys       = j.value("n_toys", 0);
  calib_.cl           = j.value("cl", 0.90);
  calib_.true_params  = parse_param_map(j.at("true_params"));
  if (j.contains("global_guess")) calib_.global_guess = parse_param_map(j.at("global_guess"));
  calib_.phi_from_data = j.value("phi_from_data", true);

  if (!(calib_.cl > 0.0 && calib_.cl < 1.0))
    throw std::invalid_argument("calibration.cl must be in (0,1)");

  ParameterVector common_guess;
  if (j.contains("phi_guess")) common_guess = parse_param_map(j.at("phi_guess"));

  calib_.hypotheses.clear();
  if (j.contains("hypotheses")) {
    for (const auto& jh : j.at("hypotheses")) {
      HypothesisPoint h;
      h.theta_fixed = parse_param_map(jh.at("theta"));
      h.phi_guess   = jh.contains("phi_guess") ? parse_param_map(jh.at("phi_guess")) : common_guess;
      if (jh.contains("phi_true")) h.phi_true = parse_param_map(jh.at("phi_true"));
      h.label       = jh.value("label", point_label(h.theta_fixed));
      calib_.hypotheses.push_back(std::move(h));
    }
  }
  if (j.contains("scan")) {
    const auto& js = j.at("scan");
    const auto param = js.at("param").get<std::string>();
    for (double v : ExpandAxis(js.at("values"), param)) {
      HypothesisPoint h;
      h.theta_fixed[param] = v;
      h.phi_guess = common_guess;
      h.label = point_label(h.theta_fixed);
      calib_.hypotheses.push_back(std::move(h));
    }
  }
}

ParameterRegistry ConfigManager::MakeRegistry() const {
  ParameterRegistry reg;
  for (const auto& s : params_) reg.Add(s);
  return reg;
}

std::vector<double> ExpandAxis(const nlohmann::json& spec, const std::string& kind)
{
  std::vector<double> vals;

  if (spec.is_object()) {
    if (spec.contains("values")) {
      for (const auto& v : spec.at("values")) vals.push_back(v.get<double>());
    }
    if (spec.contains("linspace")) {
      const auto& p   = spec.at("linspace");
      const double a  = p.at("start").get<double>();
      const double b  = p.at("stop").get<double>();
      const int    n  = p.at("num").get<int>();
      const bool endpoint = p.value("endpoint", true);

      if (n <= 0) throw std::runtime_error("linspace.num must be >0 for axis " + kind);
      if (n == 1) {
        vals.push_back(a);
      } else {
        const int nsteps = endpoint ? (n - 1) : n;
        const double step = (b - a) / static_cast<double>(nsteps);
        for (int i = 0; i < n; ++i) vals.push_back(a + i * step);
      }
    }
    if (spec.contains("logspace")) {
      const auto& p  = spec.at("logspace");
      const double a = p.at("start_exp").get<double>();
      const double b = p.at("stop_exp").get<double>();
      const int    n = p.at("num").get<int>();
      const bool endpoint = p.value("endpoint", true);

      if (n <= 0) throw std::runtime_error("logspace.num must be >0 for axis " + kind);
      if (n == 1) {
        vals.push_back(std::pow(10.0, a));
      } else {
        const int nsteps = endpoint ? (n - 1) : n;
        const double step = (b - a) / static_cast<double>(nsteps);
        for (int i = 0; i < n; ++i) vals.push_back(std::pow(10.0, a + i * step));
      }
    }
  } else if (spec.is_array()) {
    for (const auto& v : spec) vals.push_back(v.get<double>());
  } else {
    throw std::runtime_error("Grid for '" + kind + "' must be dict or list in JSON.");
  }

  // keep first occurrence
  std::vector<double> out;
  out.reserve(vals.size());
  for (double v : vals) {
    if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
  }
  return out;
}

} // namespace neymanplr
