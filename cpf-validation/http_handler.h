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

#ifndef CPF_VALIDATION_HTTP_HANDLER_H
#define CPF_VALIDATION_HTTP_HANDLER_H

#include "cpf_validator.h"
#include "structured_log.h"
#include "validation_config.h"
#include <google/cloud/functions/function.h>
#include <google/cloud/functions/http_request.h>
#include <google/cloud/functions/http_response.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cpf_validation {

// Decodes `%XX` escapes. In query strings `+` is a space, in paths it is a
// literal `+`.
//
// @throws std::invalid_argument on a truncated or non-hexadecimal escape.
std::string PercentDecode(std::string_view encoded, bool plus_is_space = true);

// Splits `a=1&b=2` into decoded key/value pairs. Repeated keys keep the
// first value.
std::map<std::string, std::string> ParseQuery(std::string_view query);

/**
 * Finds the CPF in a request.
 *
 * The sources are tried in order:
 * - the `cpf` query parameter,
 * - for `POST` requests with a body, the `cpf` field of a JSON object,
 * - the last non-empty segment of the request path.
 *
 * @throws std::invalid_argument if the request is malformed.
 */
std::optional<std::string> ExtractCandidate(
    google::cloud::functions::HttpRequest const& request);

google::cloud::functions::HttpResponse HandleValidationRequest(
    google::cloud::functions::HttpRequest const& request,
    ValidationConfig const& config, StructuredLogger& logger);

// Wraps HandleValidationRequest() for `google::cloud::functions::Run()`.
google::cloud::functions::Function MakeCpfValidationFunction(
    ValidationConfig config, StructuredLogger& logger);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_HTTP_HANDLER_H
