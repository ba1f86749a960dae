#pragma once
#include <string>

namespace neymanplr {

/// Minimizer configuration, from the "fit" block of the JSON config.
struct FitSettings {
  std::string minimizer = "Minuit2";
  std::string algorithm = "Migrad";
  int    max_function_calls = 10000;  ///< evaluation ceiling per fit
  int    max_iterations     = 10000;
  double tolerance          = 0.01;   ///< Minuit EDM tolerance
  int    strategy           = 1;
  int    print_level        = 0;

  // Curvature check after global fits
  bool   compute_curvature        = true;
  double flat_curvature_threshold = 1e-6;  ///< d2(lnL)/dp2 below this is "flat"

  int    verbosity = 0;   ///< 0=silent, 1=summary, 2+=debug
};

} // namespace neymanplr
