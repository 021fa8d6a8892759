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

#ifndef CPF_VALIDATION_VERDICT_JSON_H
#define CPF_VALIDATION_VERDICT_JSON_H

#include "cpf_validator.h"
#include <nlohmann/json.hpp>

namespace cpf_validation {

/**
 * Renders a verdict as JSON.
 *
 * Valid CPFs include the digits, the formatted CPF and the fiscal region:
 * @code
 * {"valid": true, "cpf": "11144477735", "formatted": "111.444.777-35",
 *  "fiscal_region": ["ES", "RJ"]}
 * @endcode
 * Invalid CPFs only include the reason:
 * @code
 * {"valid": false, "reason": "invalid-checksum"}
 * @endcode
 */
nlohmann::json VerdictToJson(ValidationResult const& result);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_VERDICT_JSON_H
