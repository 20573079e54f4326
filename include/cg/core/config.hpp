#pragma once
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <string>

namespace cg { namespace config {

// Env knobs are read once on first use; the set_* functions override them
// for the rest of the process.
//   CG_LOG_LEVEL        trace|debug|info|warn|error|off   (default warn)
//   CG_CHECK_FINITE     0|1                               (default 0)
//   CG_GRADCHECK_DELTA  finite-difference step            (default 1e-6)
//   CG_GRADCHECK_SEED   seed for random upstream grads    (default 0xC0FFEE)

inline bool _env_bool(const char* name, bool def=false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

inline double _env_double(const char* name, double def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0' || !(v > 0.0)) return def;
  return v;
}

inline unsigned long long _env_ull(const char* name, unsigned long long def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 0);
  if (end == s || *end != '\0') return def;
  return v;
}

// ---------- Log level (string form, parsed by the logger) ----------
inline std::string log_level_name() {
  const char* s = std::getenv("CG_LOG_LEVEL");
  return (s && *s) ? std::string(s) : std::string("warn");
}

// ---------- Finite check after forward ----------
inline std::atomic<bool>& _check_finite_flag() {
  static std::atomic<bool> v{ _env_bool("CG_CHECK_FINITE", false) };
  return v;
}
inline void set_check_finite(bool on) {
  _check_finite_flag().store(on, std::memory_order_relaxed);
}
inline bool check_finite_enabled() {
  return _check_finite_flag().load(std::memory_order_relaxed);
}

// ---------- Gradient checking defaults ----------
inline std::atomic<double>& _gradcheck_delta() {
  static std::atomic<double> v{ _env_double("CG_GRADCHECK_DELTA", 1e-6) };
  return v;
}
inline void set_gradcheck_delta(double d) {
  if (!(d > 0.0)) d = 1e-6;
  _gradcheck_delta().store(d, std::memory_order_relaxed);
}
inline double gradcheck_delta() {
  return _gradcheck_delta().load(std::memory_order_relaxed);
}

inline std::atomic<unsigned long long>& _gradcheck_seed() {
  static std::atomic<unsigned long long> v{ _env_ull("CG_GRADCHECK_SEED", 0xC0FFEEULL) };
  return v;
}
inline void set_gradcheck_seed(unsigned long long s) {
  _gradcheck_seed().store(s, std::memory_order_relaxed);
}
inline unsigned long long gradcheck_seed() {
  return _gradcheck_seed().load(std::memory_order_relaxed);
}

}} // namespace cg::config
