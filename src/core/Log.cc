#include "neymanplr/core/Log.hh"

namespace neymanplr {

std::mutex& LogMutex() {
  static std::mutex mtx;
  return mtx;
}

} // namespace neymanplr
