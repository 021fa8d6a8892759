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

#ifndef CPF_VALIDATION_VALIDATION_CONFIG_H
#define CPF_VALIDATION_VALIDATION_CONFIG_H

#include "cpf_validator.h"
#include "structured_log.h"
#include <optional>
#include <string>
#include <string_view>

namespace cpf_validation {

// Runtime settings, read once from the environment when the function starts.
struct ValidationConfig {
  ValidationOptions options;
  Severity log_level = Severity::kInfo;
};

// Reads `CPF_REJECT_REPEATED_DIGITS` and `CPF_LOG_LEVEL`, unset variables
// keep their defaults.
//
// @throws std::runtime_error if a variable holds an invalid value.
ValidationConfig ConfigFromEnvironment();

// @throws std::runtime_error naming @p var if @p value is not a boolean.
bool ParseBool(char const* var, std::string_view value);

// Returns the value of @p var, or std::nullopt when it is not set.
std::optional<std::string> GetEnv(char const* var);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_VALIDATION_CONFIG_H
