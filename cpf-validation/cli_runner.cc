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

#include "cli_runner.h"
#include "verdict_json.h"
#include <fmt/format.h>
#include <istream>
#include <ostream>

namespace cpf_validation {

std::string RenderResult(std::string const& input,
                         ValidationResult const& result, OutputFormat format) {
  if (format == OutputFormat::kText) {
    return fmt::format("{}: {}", input, VerdictName(result.verdict));
  }
  auto json = VerdictToJson(result);
  json["input"] = input;
  // Invalid UTF-8 in the input is replaced, not reported as an error.
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

int RunCli(ParseResult const& args, std::istream& in, std::ostream& out) {
  if (args.help) return kExitAllValid;
  if (args.complete) {
    out << FormatCpf(CompleteCpf(*args.complete)) << "\n";
    return kExitAllValid;
  }

  auto status = kExitAllValid;
  auto check = [&](std::string const& input) {
    auto const result = Validate(input, args.options);
    if (!result.valid()) status = kExitSomeInvalid;
    out << RenderResult(input, result, args.format) << "\n";
  };
  for (auto const& c : args.candidates) check(c);
  if (args.read_stdin) {
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.empty()) continue;
      check(line);
    }
  }
  return status;
}

}  // namespace cpf_validation
