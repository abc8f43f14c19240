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

#include "base/logger.hpp"

#include <iostream>
#include <system_error>

namespace beacon {

Logger *_logger{nullptr};

Elapsed Logger::e;

static constexpr auto flags{fmt::file::WRONLY | fmt::file::APPEND | fmt::file::CREATE};

Logger *Logger::create(const string &path, bool debug) noexcept { // static
  // never deleted, detached helpers may still hold the pointer at exit
  if (_logger == nullptr) _logger = new Logger();

  _logger->open(path, debug);

  return _logger;
}

void Logger::shutdown() noexcept { // static
  if (_logger == nullptr) return;

  std::unique_lock lck(_logger->mtx);
  _logger->close();
}

void Logger::open(const string &path, bool dbg) noexcept {
  std::unique_lock lck(mtx);

  close();
  debug = dbg;

  try {
    out.emplace(fmt::output_file(path, flags));
  } catch (const std::system_error &err) {
    // fall back to stdout so startup failures are still visible
    std::cerr << "unable to open log file " << path << ": " << err.what() << std::endl;

    try {
      out.emplace(fmt::output_file("/dev/stdout", flags));
    } catch (const std::system_error &stdout_err) {
      std::cerr << "logging disabled: " << stdout_err.what() << std::endl;
      return;
    }
  }

  out->print("\n{:%FT%H:%M:%S} START\n", std::chrono::system_clock::now());
}

void Logger::close() noexcept {
  if (!out.has_value()) return;

  out->print("\n{:%FT%H:%M:%S} STOP\n", std::chrono::system_clock::now());
  out->close();
  out.reset();
}

bool Logger::should_log(csv, csv cat) const noexcept {
  return debug || (cat != csv{"debug"});
}

} // namespace beacon
