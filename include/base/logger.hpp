// Beacon
// Copyright (C) 2022 Tim Hughey
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// https://www.wisslanding.com

#pragma once

#include "base/dura_t.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"

#include <chrono>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/os.h>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace beacon {

class Logger;

/// @brief The process logger, created once and never destroyed
extern Logger *_logger;

class Logger {

public:
  Logger() = default;
  Logger(const Logger &) = delete;
  Logger(Logger &) = delete;
  Logger(Logger &&) = delete;

  /// @brief Create (or reopen) the process wide logger
  /// @param path file to append to (e.g. /dev/stdout or /var/log/beacon.log)
  /// @param debug when false lines in the 'debug' category are dropped
  /// @return raw pointer to the process logger
  static Logger *create(const string &path, bool debug = false) noexcept;

  template <typename... Args>
  void info(csv mod_id, csv cat, fmt::format_string<Args...> format, Args &&...args) {
    std::unique_lock lck(mtx);

    if (!out.has_value() || !should_log(mod_id, cat)) return;

    const auto runtime{e.as<millis_fp>()};

    const auto prefix = fmt::format(prefix_format,      //
                                    runtime.count(),    // millis since app start
                                    width_ts,           // width of timestamp field
                                    width_ts_precision, // runtime + width and precision
                                    mod_id, width_mod,  // module_id + width
                                    cat, width_cat);    // category + width

    auto msg = fmt::format(format, std::forward<Args>(args)...);

    if (msg.empty() || (msg.back() != '\n')) msg.append("\n");

    out->print("{} {}", prefix, msg);
    out->flush();
  }

  bool should_log(csv mod, csv cat) const noexcept;

  /// @brief Write STOP and close the log file.  The logger object remains,
  ///        lines from threads still running at exit are dropped.
  static void shutdown() noexcept;

private:
  void open(const string &path, bool debug) noexcept;
  void close() noexcept; // mtx held

private:
  std::mutex mtx;
  std::optional<fmt::ostream> out;
  bool debug{false};

  static Elapsed e;

public:
  static constexpr fmt::string_view prefix_format{"{:>{}.{}f} {:<{}} {:<{}}"};
  static constexpr int width_cat{12};
  static constexpr int width_mod{12};
  static constexpr int width_ts_precision{1};
  static constexpr int width_ts{11};

public:
  MOD_ID("logger");
};

#define INFO(__cat, format, ...)                                                                   \
  do {                                                                                             \
    if (beacon::_logger) beacon::_logger->info(module_id, __cat, format, ##__VA_ARGS__);           \
  } while (0)

#define INFO_AUTO_CAT(cat)                                                                         \
  static constexpr std::string_view fn_id { cat }

#define INFO_AUTO(format, ...)                                                                     \
  do {                                                                                             \
    if (beacon::_logger) beacon::_logger->info(module_id, fn_id, format, ##__VA_ARGS__);           \
  } while (0)

#define INFO_INIT(format, ...)                                                                     \
  do {                                                                                             \
    if (beacon::_logger) beacon::_logger->info(module_id, "init"sv, format, ##__VA_ARGS__);        \
  } while (0)

} // namespace beacon
