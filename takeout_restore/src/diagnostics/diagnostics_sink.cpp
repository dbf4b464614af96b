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

#include "diagnostics/diagnostics_sink.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace takeoutrestore {
auto LevelToString(DiagnosticLevel level) -> const char* {
  switch (level) {
    case DiagnosticLevel::DEBUG:
      return "DEBUG";
    case DiagnosticLevel::INFO:
      return "INFO";
    case DiagnosticLevel::WARNING:
      return "WARNING";
    case DiagnosticLevel::ERROR:
      return "ERROR";
  }
  return "INFO";
}

auto KindToString(DiagnosticKind kind) -> const char* {
  switch (kind) {
    case DiagnosticKind::GENERAL:
      return "general";
    case DiagnosticKind::MATCHED:
      return "matched";
    case DiagnosticKind::NO_MATCH:
      return "no-match";
    case DiagnosticKind::AMBIGUOUS_MATCH:
      return "ambiguous-match";
    case DiagnosticKind::UNREADABLE_SIDECAR:
      return "unreadable-sidecar";
    case DiagnosticKind::UNCONSUMED_SIDECAR:
      return "unconsumed-sidecar";
    case DiagnosticKind::INJECTION_FAILED:
      return "injection-failed";
    case DiagnosticKind::CLEANUP_FAILED:
      return "cleanup-failed";
  }
  return "general";
}

auto ParseLevel(const std::string& text) -> DiagnosticLevel {
  const std::string folded = conv::FoldCase(text);
  if (folded == "debug") return DiagnosticLevel::DEBUG;
  if (folded == "info") return DiagnosticLevel::INFO;
  if (folded == "warning" || folded == "warn") return DiagnosticLevel::WARNING;
  if (folded == "error") return DiagnosticLevel::ERROR;
  throw std::invalid_argument("Unknown log level: " + text);
}

void DiagnosticsSink::Debug(const std::string& message, const file_path_t& path) {
  Report({DiagnosticLevel::DEBUG, DiagnosticKind::GENERAL, path, message});
}

void DiagnosticsSink::Info(const std::string& message, const file_path_t& path) {
  Report({DiagnosticLevel::INFO, DiagnosticKind::GENERAL, path, message});
}

void DiagnosticsSink::Warning(const std::string& message, const file_path_t& path) {
  Report({DiagnosticLevel::WARNING, DiagnosticKind::GENERAL, path, message});
}

void DiagnosticsSink::Error(const std::string& message, const file_path_t& path) {
  Report({DiagnosticLevel::ERROR, DiagnosticKind::GENERAL, path, message});
}

void StreamDiagnosticsSink::Report(const Diagnostic& diagnostic) {
  if (diagnostic.level_ < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  out_ << "[" << LevelToString(diagnostic.level_) << "] " << diagnostic.message_;
  if (!diagnostic.path_.empty()) {
    out_ << " (" << conv::PathToUtf8(diagnostic.path_) << ")";
  }
  out_ << std::endl;
}

void TeeDiagnosticsSink::Report(const Diagnostic& diagnostic) {
  for (auto& sink : sinks_) {
    sink->Report(diagnostic);
  }
}

void CollectingDiagnosticsSink::Report(const Diagnostic& diagnostic) {
  std::lock_guard<std::mutex> lock(mtx_);
  diagnostics_.push_back(diagnostic);
}

auto CollectingDiagnosticsSink::Snapshot() const -> std::vector<Diagnostic> {
  std::lock_guard<std::mutex> lock(mtx_);
  return diagnostics_;
}

auto CollectingDiagnosticsSink::CountOf(DiagnosticKind kind) const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<size_t>(std::count_if(
      diagnostics_.begin(), diagnostics_.end(),
      [kind](const Diagnostic& diagnostic) { return diagnostic.kind_ == kind; }));
}

void CollectingDiagnosticsSink::Clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  diagnostics_.clear();
}
};  // namespace takeoutrestore
