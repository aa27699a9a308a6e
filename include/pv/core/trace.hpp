#pragma once
#include <chrono>
#include <cstdio>

#include "pv/core/config.hpp"

namespace pv::trace {

struct ScopedTimer {
  const char* label;
  bool on;
  std::chrono::steady_clock::time_point t0;

  explicit ScopedTimer(const char* lbl)
    : label(lbl), on(config::trace_enabled()),
      t0(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    if (!on) return;
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(steady_clock::now() - t0).count();
    std::fprintf(stderr, "[PV] %s | %lld us\n",
                 label ? label : "(unnamed)",
                 static_cast<long long>(us));
    std::fflush(stderr);
  }
};

} // namespace pv::trace

#define PV_TRACE_LOG(...) \
  do { \
    if (::pv::config::trace_enabled()) { \
      std::fprintf(stderr, "[PV] "); \
      std::fprintf(stderr, __VA_ARGS__); \
      std::fprintf(stderr, "\n"); \
      std::fflush(stderr); \
    } \
  } while (0)

#define PV_CONCAT_PV_TIMER(a,b) PV_CONCAT_PV_TIMER_IMPL(a,b)
#define PV_CONCAT_PV_TIMER_IMPL(a,b) a##b
#define PV_UNIQUE_PV_TIMER PV_CONCAT_PV_TIMER(__pv_timer_, __LINE__)
#define PV_TRACE_SCOPE(label_literal) ::pv::trace::ScopedTimer PV_UNIQUE_PV_TIMER{label_literal}
