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

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace takeoutrestore {
enum class DiagnosticLevel : uint8_t { DEBUG = 0, INFO, WARNING, ERROR };

enum class DiagnosticKind : uint8_t {
  GENERAL = 0,
  MATCHED,
  NO_MATCH,
  AMBIGUOUS_MATCH,
  UNREADABLE_SIDECAR,
  UNCONSUMED_SIDECAR,
  INJECTION_FAILED,
  CLEANUP_FAILED
};

struct Diagnostic {
  DiagnosticLevel level_ = DiagnosticLevel::INFO;
  DiagnosticKind  kind_  = DiagnosticKind::GENERAL;
  file_path_t     path_{};
  std::string     message_{};
};

auto LevelToString(DiagnosticLevel level) -> const char*;
auto KindToString(DiagnosticKind kind) -> const char*;
/**
 * @brief Parse "DEBUG", "INFO", "WARNING" (or "WARN") and "ERROR", case-insensitive.
 *
 * @throws std::invalid_argument on anything else
 */
auto ParseLevel(const std::string& text) -> DiagnosticLevel;

/**
 * @brief Receiver of everything the pipeline wants to tell the user. Passed explicitly into
 * every component instead of a global logger.
 */
class DiagnosticsSink {
 public:
  virtual ~DiagnosticsSink()                    = default;

  virtual void Report(const Diagnostic& diagnostic) = 0;

  void         Debug(const std::string& message, const file_path_t& path = {});
  void         Info(const std::string& message, const file_path_t& path = {});
  void         Warning(const std::string& message, const file_path_t& path = {});
  void         Error(const std::string& message, const file_path_t& path = {});
};

class NullDiagnosticsSink final : public DiagnosticsSink {
 public:
  void Report(const Diagnostic&) override {}
};

/**
 * @brief Writes "[LEVEL] message (path)" lines to a stream. Safe to share between threads.
 */
class StreamDiagnosticsSink final : public DiagnosticsSink {
 public:
  StreamDiagnosticsSink(std::ostream& out, DiagnosticLevel min_level = DiagnosticLevel::INFO)
      : out_(out), min_level_(min_level) {}

  void Report(const Diagnostic& diagnostic) override;

  void SetMinLevel(DiagnosticLevel level) { min_level_ = level; }
  auto GetMinLevel() const -> DiagnosticLevel { return min_level_; }

 private:
  std::ostream&   out_;
  DiagnosticLevel min_level_;
  std::mutex      mtx_{};
};

class TeeDiagnosticsSink final : public DiagnosticsSink {
 public:
  void AddSink(std::shared_ptr<DiagnosticsSink> sink) { sinks_.push_back(std::move(sink)); }

  void Report(const Diagnostic& diagnostic) override;

 private:
  std::vector<std::shared_ptr<DiagnosticsSink>> sinks_{};
};

/**
 * @brief Keeps every diagnostic in arrival order.
 */
class CollectingDiagnosticsSink final : public DiagnosticsSink {
 public:
  void Report(const Diagnostic& diagnostic) override;

  auto Snapshot() const -> std::vector<Diagnostic>;
  auto CountOf(DiagnosticKind kind) const -> size_t;
  void Clear();

 private:
  mutable std::mutex      mtx_{};
  std::vector<Diagnostic> diagnostics_{};
};
};  // namespace takeoutrestore
