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

#include "verdict_json.h"
#include <string>

namespace cpf_validation {

nlohmann::json VerdictToJson(ValidationResult const& result) {
  if (!result.valid()) {
    return nlohmann::json{{"valid", false},
                          {"reason", std::string(VerdictName(result.verdict))}};
  }
  return nlohmann::json{{"valid", true},
                        {"cpf", result.digits},
                        {"formatted", FormatCpf(result.digits)},
                        {"fiscal_region", FiscalRegion(result.digits)}};
}

}  // namespace cpf_validation
