//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/clock/time_provider.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace takeoutrestore {
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::_cached_steady_time;

namespace {
auto ToUtcTm(epoch_time_t time) -> std::tm {
  const std::time_t t = static_cast<std::time_t>(time);
  std::tm           tm{};
#if defined(_WIN32)
  const bool ok = gmtime_s(&tm, &t) == 0;
#else
  const bool ok = gmtime_r(&t, &tm) != nullptr;
#endif
  if (!ok) {
    throw std::out_of_range("TimeProvider: no calendar date for time " + std::to_string(time));
  }
  return tm;
}

auto FormatUtc(epoch_time_t time, const char* format) -> std::string {
  const std::tm tm      = ToUtcTm(time);
  char          buf[64] = {};
  std::strftime(buf, sizeof(buf), format, &tm);
  return buf;
}
}  // namespace

void TimeProvider::Refresh() {
  _cached_steady_time = std::chrono::steady_clock::now();
}

auto TimeProvider::ElapsedSeconds() -> double {
  auto elapsed = std::chrono::steady_clock::now() - _cached_steady_time.load();
  return std::chrono::duration<double>(elapsed).count();
}

auto TimeProvider::FromCivil(int year, unsigned month, unsigned day, unsigned hour,
                             unsigned minute, unsigned second) -> epoch_time_t {
  // Days from 1970-01-01, shifted so the year starts in March
  const int      y   = year - (month <= 2 ? 1 : 0);
  const int      era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned mp  = month > 2 ? month - 3 : month + 9;
  const unsigned doy = (153 * mp + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const int64_t  days =
      static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
  return days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 +
         static_cast<int64_t>(second);
}

auto TimeProvider::FormatExifDateTime(epoch_time_t time) -> std::string {
  return FormatUtc(time, "%Y:%m:%d %H:%M:%S");
}

auto TimeProvider::FormatIptcDate(epoch_time_t time) -> std::string {
  return FormatUtc(time, "%Y-%m-%d");
}

auto TimeProvider::FormatIptcTime(epoch_time_t time) -> std::string {
  return FormatUtc(time, "%H:%M:%S+00:00");
}

auto TimeProvider::FormatIso8601(epoch_time_t time) -> std::string {
  return FormatUtc(time, "%Y-%m-%dT%H:%M:%SZ");
}

auto TimeProvider::FormatDuration(double seconds) -> std::string {
  char buf[64] = {};
  if (seconds < 60.0) {
    std::snprintf(buf, sizeof(buf), "%.1fs", seconds);
    return buf;
  }
  const long total   = static_cast<long>(seconds);
  const long hours   = total / 3600;
  const long minutes = (total % 3600) / 60;
  const long secs    = total % 60;
  if (hours == 0) {
    std::snprintf(buf, sizeof(buf), "%ldm %lds", minutes, secs);
  } else {
    std::snprintf(buf, sizeof(buf), "%ldh %ldm %lds", hours, minutes, secs);
  }
  return buf;
}
}  // namespace takeoutrestore
