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

#include <exiv2/exiv2.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "app/restore_config.hpp"
#include "app/restore_service.hpp"
#include "cli/args.hpp"
#include "diagnostics/diagnostics_sink.hpp"
#include "utils/string/convert.hpp"

namespace {
constexpr int kExitUsage = 2;
}  // namespace

int main(int argc, const char* argv[]) {
  using namespace takeoutrestore;

  const std::string program = argc > 0 ? argv[0] : "takeout_restore";

  std::unique_ptr<Args> args;
  try {
    args = std::make_unique<Args>(argc, argv);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n\n" << Args::HelpText(program);
    return kExitUsage;
  }
  if (args->print_help_) {
    std::cout << Args::HelpText(program);
    return 0;
  }
  if (args->print_version_) {
    std::cout << "takeout_restore " << kTakeoutRestoreVersion << "\n";
    return 0;
  }

  RestoreConfig config;
  try {
    if (args->config_path_) {
      config = RestoreConfig::LoadFile(conv::Utf8ToPath(*args->config_path_));
    }
    args->ApplyTo(config);
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }

  Exiv2::LogMsg::setLevel(config.log_level_ == DiagnosticLevel::DEBUG
                              ? Exiv2::LogMsg::Level::warn
                              : Exiv2::LogMsg::Level::mute);
  Exiv2::XmpParser::initialize();

  TeeDiagnosticsSink sink;
  sink.AddSink(std::make_shared<StreamDiagnosticsSink>(std::cerr, config.log_level_));

  std::ofstream log_file;
  if (!config.log_file_.empty()) {
    log_file.open(config.log_file_, std::ios::app);
    if (!log_file.is_open()) {
      std::cerr << "Error: cannot open log file " << conv::PathToUtf8(config.log_file_) << "\n";
      return kExitUsage;
    }
    sink.AddSink(std::make_shared<StreamDiagnosticsSink>(log_file, config.log_level_));
  }

  int exit_code = 0;
  try {
    RestoreService service(config, sink);
    exit_code = service.Run().ExitCode();
  } catch (const std::exception& e) {
    sink.Error(e.what());
    exit_code = kExitUsage;
  }
  Exiv2::XmpParser::terminate();
  return exit_code;
}
