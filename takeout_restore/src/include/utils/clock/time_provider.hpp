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

#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "type/type.hpp"

namespace takeoutrestore {
class TimeProvider {
 public:
  // 1800-01-01 00:00:00 and 9999-12-31 23:59:59 UTC
  static constexpr epoch_time_t kMinSupportedTime = -5364662400;
  static constexpr epoch_time_t kMaxSupportedTime = 253402300799;

  static void Refresh();
  // Seconds since the last Refresh()
  static auto ElapsedSeconds() -> double;

  /**
   * @brief Seconds since the epoch for a UTC civil date, proleptic Gregorian calendar
   */
  static auto FromCivil(int year, unsigned month, unsigned day, unsigned hour = 0,
                        unsigned minute = 0, unsigned second = 0) -> epoch_time_t;

  static auto IsSupportedTime(epoch_time_t time) -> bool {
    return time >= kMinSupportedTime && time <= kMaxSupportedTime;
  }

  /**
   * @brief Format functions below take a supported time
   *
   * @throws std::out_of_range when the time cannot be broken down into a calendar date
   */
  // "YYYY:MM:DD HH:MM:SS", UTC
  static auto FormatExifDateTime(epoch_time_t time) -> std::string;
  // "YYYY-MM-DD", UTC
  static auto FormatIptcDate(epoch_time_t time) -> std::string;
  // "HH:MM:SS+00:00"
  static auto FormatIptcTime(epoch_time_t time) -> std::string;
  // "YYYY-MM-DDTHH:MM:SSZ"
  static auto FormatIso8601(epoch_time_t time) -> std::string;
  // "12.3s", "4m 5s", "1h 2m 3s"
  static auto FormatDuration(double seconds) -> std::string;

 private:
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;
};
};  // namespace takeoutrestore
