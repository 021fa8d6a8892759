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

#include "cpf_validator.h"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace cpf_validation {
namespace {

auto constexpr kCpfLength = 11;
auto constexpr kBaseLength = 9;

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool AllDigits(std::string_view s, std::size_t length) {
  return s.size() == length && std::all_of(s.begin(), s.end(), IsDigit);
}

// Weights run from `count + 1` down to 2. The sum is reduced modulo 11, a
// remainder below 2 maps to 0.
int CheckDigit(std::string_view digits, int count) {
  int sum = 0;
  for (int i = 0; i != count; ++i) {
    sum += (digits[i] - '0') * (count + 1 - i);
  }
  auto const remainder = sum % 11;
  return remainder < 2 ? 0 : 11 - remainder;
}

std::string NormalizeOrThrow(std::string_view raw, std::size_t length) {
  auto digits = Normalize(raw);
  if (!AllDigits(digits, length)) {
    throw std::invalid_argument(
        fmt::format("expected {} digits, got <{}>", length, raw));
  }
  return digits;
}

}  // namespace

std::string_view VerdictName(Verdict verdict) {
  switch (verdict) {
    case Verdict::kValid:
      return "valid";
    case Verdict::kInvalidFormat:
      return "invalid-format";
    case Verdict::kInvalidChecksum:
      return "invalid-checksum";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, Verdict verdict) {
  return os << VerdictName(verdict);
}

std::string Normalize(std::string_view raw) {
  std::string digits;
  digits.reserve(raw.size());
  std::copy_if(raw.begin(), raw.end(), std::back_inserter(digits),
               [](char c) { return c != '.' && c != '-'; });
  return digits;
}

ValidationResult Validate(std::string_view raw,
                          ValidationOptions const& options) {
  auto digits = Normalize(raw);
  if (!AllDigits(digits, kCpfLength)) {
    return ValidationResult{Verdict::kInvalidFormat, std::move(digits)};
  }
  auto const repeated =
      std::all_of(digits.begin(), digits.end(),
                  [first = digits.front()](char c) { return c == first; });
  if (options.reject_repeated_digits && repeated) {
    return ValidationResult{Verdict::kInvalidChecksum, std::move(digits)};
  }
  auto const d1 = CheckDigit(digits, kBaseLength);
  auto const d2 = CheckDigit(digits, kBaseLength + 1);
  if (d1 != digits[9] - '0' || d2 != digits[10] - '0') {
    return ValidationResult{Verdict::kInvalidChecksum, std::move(digits)};
  }
  return ValidationResult{Verdict::kValid, std::move(digits)};
}

std::pair<int, int> ComputeCheckDigits(std::string_view base) {
  auto digits = NormalizeOrThrow(base, kBaseLength);
  auto const d1 = CheckDigit(digits, kBaseLength);
  digits.push_back(static_cast<char>('0' + d1));
  return {d1, CheckDigit(digits, kBaseLength + 1)};
}

std::string CompleteCpf(std::string_view base) {
  auto const [d1, d2] = ComputeCheckDigits(base);
  return fmt::format("{}{}{}", Normalize(base), d1, d2);
}

std::string FormatCpf(std::string_view raw) {
  auto const digits = NormalizeOrThrow(raw, kCpfLength);
  return fmt::format("{}.{}.{}-{}", digits.substr(0, 3), digits.substr(3, 3),
                     digits.substr(6, 3), digits.substr(9, 2));
}

std::vector<std::string> FiscalRegion(std::string_view raw) {
  static std::array<std::vector<std::string>, 10> const kRegions{{
          {"RS"},
          {"DF", "GO", "MS", "MT", "TO"},
          {"AC", "AM", "AP", "PA", "RO", "RR"},
          {"CE", "MA", "PI"},
          {"AL", "PB", "PE", "RN"},
          {"BA", "SE"},
          {"MG"},
          {"ES", "RJ"},
          {"SP"},
          {"PR", "SC"},
      }};
  auto const digits = NormalizeOrThrow(raw, kCpfLength);
  return kRegions[digits[8] - '0'];
}

}  // namespace cpf_validation
