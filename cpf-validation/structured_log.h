// Copyright 2026 Google LLC
//
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

#ifndef CPF_VALIDATION_STRUCTURED_LOG_H
#define CPF_VALIDATION_STRUCTURED_LOG_H

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace cpf_validation {

enum class Severity { kDebug, kInfo, kWarning, kError };

std::string_view SeverityName(Severity severity);

// @throws std::runtime_error if @p name is not a known severity.
Severity ParseSeverity(std::string_view name);

/**
 * Writes log entries as single-line JSON objects.
 *
 * Cloud Run and Cloud Functions forward each line on stdout to Cloud Logging,
 * and lines holding a JSON object become structured entries: the `severity`
 * and `message` fields are recognized, other fields go into `jsonPayload`.
 */
class StructuredLogger {
 public:
  explicit StructuredLogger(std::ostream& os,
                            Severity min_severity = Severity::kInfo)
      : os_(os), min_severity_(min_severity) {}

  void set_min_severity(Severity severity);
  Severity min_severity() const;

  void Log(Severity severity, std::string const& message,
           nlohmann::json fields = nlohmann::json::object());

 private:
  mutable std::mutex mu_;
  std::ostream& os_;
  Severity min_severity_;
};

// The process-wide logger, writing to std::cout.
StructuredLogger& DefaultLogger();

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_STRUCTURED_LOG_H
