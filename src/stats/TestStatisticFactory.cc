#include "neymanplr/stats/TestStatisticFactory.hh"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "neymanplr/stats/ProfileLikelihoodRatio.hh"

namespace neymanplr::stats {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

std::unique_ptr<ITestStatistic>
MakeTestStatistic(const StatisticsConfig& cfg) {
  const std::string name = to_lower(cfg.test_stat);

  if (name == "plr_onesided" || name == "qmu") {
    if (cfg.poi.empty())
      throw std::invalid_argument("statistics.poi is required for test_stat=\"" + cfg.test_stat + "\"");
    if (cfg.verbosity > 0) {
      std::cout << "[stats] Using one-sided profile likelihood ratio on '" << cfg.poi << "'\n";
    }
    return std::make_unique<OneSidedProfileLikelihoodRatio>(cfg.poi, cfg.fit,
                                                            cfg.negative_tolerance, cfg.verbosity);
  }

  if (name == "plr" || name.empty()) {
    if (cfg.verbosity > 0) {
      std::cout << "[stats] Using ProfileLikelihoodRatio test statistic (\"" << cfg.test_stat << "\")\n";
    }
    return std::make_unique<ProfileLikelihoodRatio>(cfg.fit, cfg.negative_tolerance, cfg.verbosity);
  }

  // Unknown name -> warn and fall back to PLR
  std::cerr << "[stats] WARNING: unknown test_stat=\"" << cfg.test_stat
            << "\". Falling back to ProfileLikelihoodRatio.\n";
  return std::make_unique<ProfileLikelihoodRatio>(cfg.fit, cfg.negative_tolerance, cfg.verbosity);
}

} // namespace neymanplr::stats
