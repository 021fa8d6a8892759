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

#include "validation_config.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace cpf_validation {

std::optional<std::string> GetEnv(char const* var) {
  auto const* value = std::getenv(var);
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

bool ParseBool(char const* var, std::string_view value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error(fmt::format(
      "Environment variable {} must be a boolean, got <{}>", var, value));
}

ValidationConfig ConfigFromEnvironment() {
  ValidationConfig config;
  if (auto v = GetEnv("CPF_REJECT_REPEATED_DIGITS")) {
    config.options.reject_repeated_digits =
        ParseBool("CPF_REJECT_REPEATED_DIGITS", *v);
  }
  if (auto v = GetEnv("CPF_LOG_LEVEL")) {
    try {
      config.log_level = ParseSeverity(*v);
    } catch (std::runtime_error const& ex) {
      throw std::runtime_error(
          fmt::format("Environment variable CPF_LOG_LEVEL: {}", ex.what()));
    }
  }
  return config;
}

}  // namespace cpf_validation
