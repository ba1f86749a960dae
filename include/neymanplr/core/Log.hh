#pragma once
#include <mutex>

namespace neymanplr {

/// Serializes multi-part log lines written from calibration worker threads.
/// Hold it while streaming one message to std::cout or std::cerr.
std::mutex& LogMutex();

} // namespace neymanplr
