#include "neymanplr/model/LikelihoodModel.hh"
#include "neymanplr/core/Errors.hh"
#include "neymanplr/core/Log.hh"
#include "neymanplr/fit/Profiler.hh"
#include "neymanplr/simulate/ToyMCSimulator.hh"

#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace neymanplr {

LikelihoodModel::LikelihoodModel(ParameterRegistry registry,
                                 std::vector<TermPtr> terms,
                                 std::shared_ptr<const SourceModel> sources)
: registry_(std::move(registry)), terms_(std::move(terms)), sources_(std::move(sources))
{
  if (terms_.empty()) throw std::invalid_argument("LikelihoodModel: no likelihood terms");

  for (const auto& t : terms_) {
    if (!t) throw std::invalid_argument("LikelihoodModel: null term");
    for (const auto& p : t->RequiredParameters()) {
      if (!registry_.Has(p))
        throw std::invalid_argument("term '" + t->Name() + "' uses undeclared parameter '" + p + "'");
      param_needed_.insert(p);
    }
  }
  for (const auto& s : registry_.specs())
    if (!param_needed_.count(s.name))
      throw std::invalid_argument("parameter '" + s.name + "' is declared but used by no term");
}

void LikelihoodModel::CheckParameters(const ParameterVector& params) const {
  for (const auto& name : param_needed_)
    if (!params.count(name)) throw MissingParameter(name, "likelihood model");
  for (const auto& kv : params)
    if (!param_needed_.count(kv.first))
      throw InvalidParameter(kv.first, "likelihood model", "not a parameter of this model");
}

double LikelihoodModel::Evaluate(const ParameterVector& params) const {
  CheckParameters(params);
  double ll = 0.0;
  for (const auto& t : terms_) ll += t->LogContribution(data_, params);
  return ll;
}

std::string LikelihoodModel::View() const {
  std::ostringstream os;
  os << "LikelihoodModel: " << terms_.size() << " term(s), " << data_.size()
     << " event(s), data generation " << data_generation_ << "\n";
  os << "  parameters (param_needed):\n";
  for (const auto& s : registry_.specs()) {
    os << "    " << s.name << " [" << ToString(s.role) << "] default=" << s.default_value
       << " bounds=[" << s.lower << ", " << s.upper << "]\n";
  }
  os << "  terms:\n";
  for (const auto& t : terms_) {
    os << "    " << t->Describe() << "\n";
    os << "      uses:";
    for (const auto& p : t->RequiredParameters()) os << " " << p;
    os << "\n";
  }
  if (HasValidFit()) {
    os << "  global fit: lnL=" << fit_cache_.result->max_loglik
       << " at " << ToString(fit_cache_.result->params) << "\n";
  } else {
    os << "  global fit: none for current data\n";
  }
  return os.str();
}

void LikelihoodModel::SetData(Dataset data) {
  if (sources_ && !sources_->empty()) {
    for (std::size_t i = 0; i < data.size(); ++i) {
      if (static_cast<int>(data[i].x.size()) != sources_->ndim()) {
        std::ostringstream os;
        os << "event " << i << " has " << data[i].x.size() << " feature(s), templates expect "
           << sources_->ndim();
        throw std::invalid_argument(os.str());
      }
    }
  }
  data_ = std::move(data);
  // a cached fit stays inspectable but no longer matches the generation
  ++data_generation_;
}

void LikelihoodModel::SetDataFromToyMC(const ParameterVector& true_params, std::mt19937_64& rng) {
  if (!sources_ || sources_->empty())
    throw SimulationInconsistency("likelihood model", "no source model to simulate from");
  CheckParameters(true_params);

  // the simulator reads the same SourceModel instance as the terms
  ToyMCSimulator sim(sources_);
  SetData(sim.Simulate(true_params, rng));
}

const FitResult& LikelihoodModel::SetMaxLogLikelihood(const ParameterVector& param_guess) {
  InvalidateFit();
  Profiler prof(fit_settings_);
  FitResult r = prof.MaximizeGlobal(*this, param_guess);
  r.data_generation = data_generation_;

  if (fit_settings_.verbosity > 0) {
    std::lock_guard<std::mutex> lk(LogMutex());
    std::cout << "[fit] global maximum lnL=" << r.max_loglik << " at " << ToString(r.params)
              << " (" << r.n_calls << " calls)\n";
  }
  fit_cache_.result = std::move(r);
  return *fit_cache_.result;
}

bool LikelihoodModel::HasValidFit() const noexcept {
  return fit_cache_.result.has_value() && fit_cache_.result->data_generation == data_generation_;
}

const FitResult& LikelihoodModel::GlobalFit() const {
  if (!HasValidFit()) {
    std::optional<std::uint64_t> fit_gen;
    if (fit_cache_.result) fit_gen = fit_cache_.result->data_generation;
    throw StaleFitError(data_generation_, fit_gen);
  }
  return *fit_cache_.result;
}

} // namespace neymanplr
