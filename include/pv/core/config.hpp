#pragma once
#include <atomic>
#include <cstdlib>
#include <cstring>

namespace pv { namespace config {

inline bool _env_bool(const char* name, bool def=false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

// ---------- Checked mode (env + runtime) ----------
// Operations that assume rectangularity (flattening, element-wise maps,
// arithmetic) validate their operands first when this is on.
//   Env: PV_CHECKED=0|1
inline std::atomic<bool>& checked_flag() {
  static std::atomic<bool> v{ _env_bool("PV_CHECKED", false) };
  return v;
}
inline void set_checked(bool on) {
  checked_flag().store(on, std::memory_order_relaxed);
}

// Scoped override (thread-local depth counter).
inline int& _checked_scope_depth() { static thread_local int d = 0; return d; }

struct ScopedChecked {
  ScopedChecked() { ++_checked_scope_depth(); }
  ~ScopedChecked() { --_checked_scope_depth(); }
  ScopedChecked(const ScopedChecked&) = delete;
  ScopedChecked& operator=(const ScopedChecked&) = delete;
  static int depth() { return _checked_scope_depth(); }
};

inline bool checked_enabled() {
  const bool env_now = _env_bool("PV_CHECKED", checked_flag().load(std::memory_order_relaxed));
  if (env_now != checked_flag().load(std::memory_order_relaxed)) {
    checked_flag().store(env_now, std::memory_order_relaxed);
  }
  return env_now || ScopedChecked::depth() > 0;
}

// ---------- Tracing ----------
//   Env: PV_TRACE=0|1
inline std::atomic<bool>& trace_flag() {
  static std::atomic<bool> v{ _env_bool("PV_TRACE", false) };
  return v;
}
inline void set_trace(bool on) {
  trace_flag().store(on, std::memory_order_relaxed);
}
inline bool trace_enabled() {
  return trace_flag().load(std::memory_order_relaxed);
}

}} // namespace pv::config
