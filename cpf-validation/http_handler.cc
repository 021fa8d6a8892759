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

#include "http_handler.h"
#include "verdict_json.h"
#include <google/cloud/functions/framework.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace cpf_validation {
namespace {

namespace gcf = ::google::cloud::functions;

auto constexpr kOkay = 200;
auto constexpr kBadRequest = 400;
auto constexpr kMethodNotAllowed = 405;

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

gcf::HttpResponse JsonResponse(int code, nlohmann::json const& body) {
  return gcf::HttpResponse{}
      .set_result(code)
      .set_header("Content-Type", "application/json")
      .set_payload(body.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace));
}

gcf::HttpResponse ErrorResponse(int code, std::string const& message) {
  return JsonResponse(code, nlohmann::json{{"error", message}});
}

std::optional<std::string> CandidateFromBody(std::string const& payload) {
  auto const body = nlohmann::json::parse(payload, nullptr,
                                          /*allow_exceptions=*/false);
  if (body.is_discarded() || !body.is_object()) {
    throw std::invalid_argument("the request body must be a JSON object");
  }
  auto const f = body.find("cpf");
  if (f == body.end()) return std::nullopt;
  if (!f->is_string()) {
    throw std::invalid_argument("the \"cpf\" field must be a string");
  }
  return f->get<std::string>();
}

std::optional<std::string> CandidateFromPath(std::string_view path) {
  while (!path.empty() && path.back() == '/') path.remove_suffix(1);
  if (path.empty()) return std::nullopt;
  auto const pos = path.find_last_of('/');
  auto const segment =
      pos == std::string_view::npos ? path : path.substr(pos + 1);
  return PercentDecode(segment, /*plus_is_space=*/false);
}

}  // namespace

std::string PercentDecode(std::string_view encoded, bool plus_is_space) {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (std::size_t i = 0; i != encoded.size(); ++i) {
    auto const c = encoded[i];
    if (c == '+' && plus_is_space) {
      decoded.push_back(' ');
      continue;
    }
    if (c != '%') {
      decoded.push_back(c);
      continue;
    }
    if (i + 2 >= encoded.size()) {
      throw std::invalid_argument(
          fmt::format("truncated escape sequence in <{}>", encoded));
    }
    auto const hi = HexValue(encoded[i + 1]);
    auto const lo = HexValue(encoded[i + 2]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument(
          fmt::format("invalid escape sequence in <{}>", encoded));
    }
    decoded.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return decoded;
}

std::map<std::string, std::string> ParseQuery(std::string_view query) {
  std::map<std::string, std::string> params;
  while (!query.empty()) {
    auto const end = query.find('&');
    auto const pair = query.substr(0, end);
    query = end == std::string_view::npos ? std::string_view{}
                                          : query.substr(end + 1);
    if (pair.empty()) continue;
    auto const eq = pair.find('=');
    auto key = PercentDecode(pair.substr(0, eq));
    auto value = eq == std::string_view::npos
                     ? std::string{}
                     : PercentDecode(pair.substr(eq + 1));
    params.emplace(std::move(key), std::move(value));
  }
  return params;
}

std::optional<std::string> ExtractCandidate(gcf::HttpRequest const& request) {
  std::string_view target = request.target();
  auto const qpos = target.find('?');
  auto const path = target.substr(0, qpos);
  if (qpos != std::string_view::npos) {
    auto params = ParseQuery(target.substr(qpos + 1));
    auto f = params.find("cpf");
    if (f != params.end()) return std::move(f->second);
  }
  if (request.verb() == "POST" && !request.payload().empty()) {
    if (auto candidate = CandidateFromBody(request.payload())) {
      return candidate;
    }
  }
  return CandidateFromPath(path);
}

gcf::HttpResponse HandleValidationRequest(gcf::HttpRequest const& request,
                                          ValidationConfig const& config,
                                          StructuredLogger& logger) {
  if (request.verb() != "GET" && request.verb() != "POST") {
    auto const message = fmt::format("method {} not allowed", request.verb());
    logger.Log(Severity::kWarning, message);
    return ErrorResponse(kMethodNotAllowed, message)
        .set_header("Allow", "GET, POST");
  }

  std::optional<std::string> candidate;
  try {
    candidate = ExtractCandidate(request);
  } catch (std::invalid_argument const& ex) {
    logger.Log(Severity::kWarning, "malformed query, path or body");
    return ErrorResponse(kBadRequest, ex.what());
  }
  if (!candidate) {
    logger.Log(Severity::kWarning, "request without a CPF");
    return ErrorResponse(
        kBadRequest,
        "missing CPF, use the 'cpf' query parameter or the request path");
  }

  auto const result = Validate(*candidate, config.options);
  logger.Log(Severity::kInfo, "CPF validated",
             {{"verdict", std::string(VerdictName(result.verdict))},
              {"method", request.verb()}});
  return JsonResponse(kOkay, VerdictToJson(result));
}

gcf::Function MakeCpfValidationFunction(ValidationConfig config,
                                        StructuredLogger& logger) {
  return gcf::MakeFunction(
      [config = std::move(config), &logger](gcf::HttpRequest const& request) {
        return HandleValidationRequest(request, config, logger);
      });
}

}  // namespace cpf_validation
