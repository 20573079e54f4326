#include "cg/core/logger.hpp"
#include "cg/core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace cg { namespace log {

spdlog::level::level_enum parse_level(const std::string& name) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "trace") return spdlog::level::trace;
  if (s == "debug") return spdlog::level::debug;
  if (s == "info")  return spdlog::level::info;
  if (s == "warn" || s == "warning") return spdlog::level::warn;
  if (s == "error" || s == "err") return spdlog::level::err;
  if (s == "critical") return spdlog::level::critical;
  if (s == "off") return spdlog::level::off;
  return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> get() {
  // Not registered with spdlog's global registry so a host application can
  // keep its own "cg" logger.
  static std::shared_ptr<spdlog::logger> logger = []{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto l = std::make_shared<spdlog::logger>("cg", sink);
    l->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %s:%#  %v");
    l->set_level(parse_level(config::log_level_name()));
    l->flush_on(spdlog::level::err);
    return l;
  }();
  return logger;
}

void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

spdlog::level::level_enum level() { return get()->level(); }

}} // namespace cg::log
