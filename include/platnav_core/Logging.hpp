// Copyright 2025 Intelligent Robotics Lab
//
// This file is part of the project Easy Navigation (EasyNav in short)
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PLATNAV_CORE__LOGGING_HPP
#define PLATNAV_CORE__LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace platnav
{
namespace logging
{

/**
 * \brief Map a level name (trace, debug, info, warn, error, off) to spdlog.
 * \return \p fallback for unknown or null names.
 */
inline spdlog::level::level_enum level_from_string(
  const char * name,
  spdlog::level::level_enum fallback = spdlog::level::info)
{
  if (name == nullptr) {
    return fallback;
  }
  const std::string level(name);
  if (level == "trace") {return spdlog::level::trace;}
  if (level == "debug") {return spdlog::level::debug;}
  if (level == "info") {return spdlog::level::info;}
  if (level == "warn") {return spdlog::level::warn;}
  if (level == "error") {return spdlog::level::err;}
  if (level == "off") {return spdlog::level::off;}
  return fallback;
}

/**
 * \brief Process-wide "platnav" logger writing to stderr.
 *
 * The level is read once from the PLATNAV_LOG_LEVEL environment variable
 * (default info). A logger already registered under that name is reused.
 */
inline std::shared_ptr<spdlog::logger> get_logger()
{
  static std::shared_ptr<spdlog::logger> logger = []() {
      auto log = spdlog::get("platnav");
      if (!log) {
        log = spdlog::stderr_color_mt("platnav");
      }
      log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      log->set_level(level_from_string(std::getenv("PLATNAV_LOG_LEVEL")));
      return log;
    }();
  return logger;
}

}  // namespace logging
}  // namespace platnav

#endif  // PLATNAV_CORE__LOGGING_HPP
