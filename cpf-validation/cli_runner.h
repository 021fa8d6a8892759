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

#ifndef CPF_VALIDATION_CLI_RUNNER_H
#define CPF_VALIDATION_CLI_RUNNER_H

#include "cpf_validator.h"
#include "parse_args.h"
#include <iosfwd>
#include <string>

namespace cpf_validation {

auto constexpr kExitAllValid = 0;
auto constexpr kExitSomeInvalid = 1;
auto constexpr kExitUsage = 2;

// One output line for @p input, without the trailing newline.
std::string RenderResult(std::string const& input,
                         ValidationResult const& result, OutputFormat format);

// Validates the candidates in @p args, and those read from @p in when
// requested, returning the process exit status.
int RunCli(ParseResult const& args, std::istream& in, std::ostream& out);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_CLI_RUNNER_H
