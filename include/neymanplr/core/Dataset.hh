#pragma once
#include <vector>

namespace neymanplr {

/// One observed event: its feature values in template-axis order.
struct Event {
  std::vector<double> x;
  int source = -1;   // generating source index for toy events, -1 for real data
};

using Dataset = std::vector<Event>;

} // namespace neymanplr
