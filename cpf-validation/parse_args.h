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

#ifndef CPF_VALIDATION_PARSE_ARGS_H
#define CPF_VALIDATION_PARSE_ARGS_H

#include "cpf_validator.h"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cpf_validation {

enum class OutputFormat { kText, kJson };

// Parse the command line arguments.
struct ParseResult {
  // Set when the usage was printed, nothing else is set.
  bool help = false;

  std::vector<std::string> candidates;
  bool read_stdin = false;
  OutputFormat format = OutputFormat::kText;
  ValidationOptions options;

  // Complete this base instead of validating.
  std::optional<std::string> complete;
};

ParseResult ParseArguments(int argc, char const* const argv[],
                           std::ostream& usage);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_PARSE_ARGS_H
