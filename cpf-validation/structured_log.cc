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

#include "structured_log.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace cpf_validation {

std::string_view SeverityName(Severity severity) {
  switch (severity) {
    case Severity::kDebug:
      return "DEBUG";
    case Severity::kInfo:
      return "INFO";
    case Severity::kWarning:
      return "WARNING";
    case Severity::kError:
      return "ERROR";
  }
  return "DEFAULT";
}

Severity ParseSeverity(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (auto s : {Severity::kDebug, Severity::kInfo, Severity::kWarning,
                 Severity::kError}) {
    if (upper == SeverityName(s)) return s;
  }
  throw std::runtime_error(fmt::format(
      "unknown severity <{}>, expected one of DEBUG|INFO|WARNING|ERROR",
      name));
}

void StructuredLogger::set_min_severity(Severity severity) {
  std::lock_guard<std::mutex> lk(mu_);
  min_severity_ = severity;
}

Severity StructuredLogger::min_severity() const {
  std::lock_guard<std::mutex> lk(mu_);
  return min_severity_;
}

void StructuredLogger::Log(Severity severity, std::string const& message,
                           nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json{{"fields", fields}};
  fields["severity"] = std::string(SeverityName(severity));
  fields["message"] = message;
  auto const line =
      fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lk(mu_);
  if (severity < min_severity_) return;
  os_ << line << std::endl;
}

StructuredLogger& DefaultLogger() {
  static StructuredLogger logger(std::cout);
  return logger;
}

}  // namespace cpf_validation
