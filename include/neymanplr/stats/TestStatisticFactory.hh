#pragma once

#include <memory>

#include "neymanplr/stats/ITestStatistic.hh"
#include "neymanplr/stats/StatisticsConfig.hh"

namespace neymanplr::stats {

/**
 * Create an appropriate test statistic implementation based on StatisticsConfig.
 *
 *   test_stat = "PLR"          (case-insensitive) -> ProfileLikelihoodRatio
 *   test_stat = "PLR_ONESIDED" (needs cfg.poi)    -> OneSidedProfileLikelihoodRatio
 */
std::unique_ptr<ITestStatistic> MakeTestStatistic(const StatisticsConfig& cfg);

} // namespace neymanplr::stats
