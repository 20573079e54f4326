#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cg { namespace log {

// Process-wide "cg" logger (stderr, colored). Created on first use with the
// level taken from CG_LOG_LEVEL.
std::shared_ptr<spdlog::logger> get();

void set_level(spdlog::level::level_enum level);
spdlog::level::level_enum level();

// trace|debug|info|warn|warning|error|err|critical|off; anything else -> warn
spdlog::level::level_enum parse_level(const std::string& name);

}} // namespace cg::log

#define CG_LOG_AT_(lvl, ...) \
  ::cg::log::get()->log(::spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, lvl, __VA_ARGS__)

#define CG_LOG_TRACE(...) CG_LOG_AT_(::spdlog::level::trace, __VA_ARGS__)
#define CG_LOG_DEBUG(...) CG_LOG_AT_(::spdlog::level::debug, __VA_ARGS__)
#define CG_LOG_INFO(...)  CG_LOG_AT_(::spdlog::level::info,  __VA_ARGS__)
#define CG_LOG_WARN(...)  CG_LOG_AT_(::spdlog::level::warn,  __VA_ARGS__)
#define CG_LOG_ERROR(...) CG_LOG_AT_(::spdlog::level::err,   __VA_ARGS__)
