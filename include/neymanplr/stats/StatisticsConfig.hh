#pragma once

#include <string>

#include "neymanplr/fit/FitSettings.hh"

namespace neymanplr::stats {

/**
 * Configuration for the test statistic, derived from the JSON "statistics"
 * block (and the "fit" block for the profiling minimizer).
 */
struct StatisticsConfig {
  std::string test_stat = "PLR";        ///< "PLR" | "PLR_ONESIDED"
  std::string poi;                      ///< parameter of interest for one-sided variants
  double      negative_tolerance = 1e-3; ///< t below -tolerance is reported
  int         verbosity = 0;            ///< 0=silent, 1=summary, 2+=debug

  FitSettings fit;                      ///< minimizer used for profiling
};

} // namespace neymanplr::stats
