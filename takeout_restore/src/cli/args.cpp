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

#include "cli/args.hpp"

#include <cstring>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
auto Is(const char* arg, const char* long_name, const char* short_name = nullptr) -> bool {
  return std::strcmp(arg, long_name) == 0 ||
         (short_name != nullptr && std::strcmp(arg, short_name) == 0);
}

auto ParseJobs(const std::string& text) -> size_t {
  size_t    consumed = 0;
  long long jobs     = 0;
  try {
    jobs = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("--jobs expects a positive integer, got \"" + text + "\"");
  }
  if (consumed != text.size() || jobs <= 0) {
    throw std::runtime_error("--jobs expects a positive integer, got \"" + text + "\"");
  }
  return static_cast<size_t>(jobs);
}
}  // namespace

Args::Args(int argc, const char* argv[]) {
  int  i         = 1;
  auto value_for = [&](const char* option) -> std::string {
    if (i + 1 >= argc) {
      throw std::runtime_error(std::string("Missing value for ") + option);
    }
    return std::string(argv[i + 1]);
  };

  while (i < argc) {
    const char* arg = argv[i];
    if (Is(arg, "--help", "-h")) {
      print_help_ = true;
      return;
    }
    if (Is(arg, "--version")) {
      print_version_ = true;
      return;
    }
    if (Is(arg, "--config", "-c")) {
      config_path_ = value_for(arg);
      i += 2;
      continue;
    }
    if (Is(arg, "--input", "-i")) {
      input_folder_ = value_for(arg);
      i += 2;
      continue;
    }
    if (Is(arg, "--jobs", "-j")) {
      jobs_ = ParseJobs(value_for(arg));
      i += 2;
      continue;
    }
    if (Is(arg, "--log-level", "-l")) {
      try {
        log_level_ = ParseLevel(value_for(arg));
      } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
      }
      i += 2;
      continue;
    }
    if (Is(arg, "--log-file")) {
      log_file_ = value_for(arg);
      i += 2;
      continue;
    }
    if (Is(arg, "--keep-json", "-k")) {
      delete_json_ = false;
      i += 1;
      continue;
    }
    if (Is(arg, "--no-file-dates")) {
      update_file_dates_ = false;
      i += 1;
      continue;
    }
    if (Is(arg, "--dry-run", "-n")) {
      dry_run_ = true;
      i += 1;
      continue;
    }
    if (Is(arg, "--no-recursive")) {
      recursive_ = false;
      i += 1;
      continue;
    }
    throw std::runtime_error(std::string("Unknown option: ") + arg);
  }
}

void Args::ApplyTo(RestoreConfig& config) const {
  if (input_folder_) config.input_folder_ = conv::Utf8ToPath(*input_folder_);
  if (delete_json_) config.delete_json_ = *delete_json_;
  if (update_file_dates_) config.update_file_dates_ = *update_file_dates_;
  if (dry_run_) config.dry_run_ = *dry_run_;
  if (recursive_) config.recursive_ = *recursive_;
  if (jobs_) config.jobs_ = *jobs_;
  if (log_level_) config.log_level_ = *log_level_;
  if (log_file_) config.log_file_ = conv::Utf8ToPath(*log_file_);
}

auto Args::HelpText(const std::string& program) -> std::string {
  return "Usage: " + program +
         " [options]\n"
         "Restore metadata from Google Takeout sidecar JSON files into photos and videos.\n"
         "\n"
         "Options:\n"
         "  -i, --input <dir>        Google Takeout folder to process\n"
         "  -c, --config <file>      JSON configuration file, options given here win\n"
         "  -k, --keep-json          Keep the sidecars after processing\n"
         "      --no-file-dates      Do not touch file modification times\n"
         "  -n, --dry-run            Report what would be done without changing any file\n"
         "      --no-recursive       Only process the input folder itself\n"
         "  -j, --jobs <n>           Albums matched in parallel (default 1)\n"
         "  -l, --log-level <level>  DEBUG, INFO, WARNING or ERROR (default INFO)\n"
         "      --log-file <file>    Also write the log to this file\n"
         "  -h, --help               Show this help\n"
         "      --version            Show the version\n"
         "\n"
         "Exit status: 0 on success, 1 if metadata could not be written to some file,\n"
         "2 on usage or configuration errors.\n";
}
};  // namespace takeoutrestore
