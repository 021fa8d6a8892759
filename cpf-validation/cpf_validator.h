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

#ifndef CPF_VALIDATION_CPF_VALIDATOR_H
#define CPF_VALIDATION_CPF_VALIDATOR_H

#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpf_validation {

enum class Verdict { kValid, kInvalidFormat, kInvalidChecksum };

// The wire name of a verdict: "valid", "invalid-format" or "invalid-checksum".
std::string_view VerdictName(Verdict verdict);
std::ostream& operator<<(std::ostream& os, Verdict verdict);

struct ValidationOptions {
  // Strings of eleven identical digits pass the check digit arithmetic, but
  // are never issued.
  bool reject_repeated_digits = true;
};

struct ValidationResult {
  Verdict verdict;
  // The candidate with separators removed.
  std::string digits;

  bool valid() const { return verdict == Verdict::kValid; }
};

// Removes the `.` and `-` separators, any other character is kept.
std::string Normalize(std::string_view raw);

// Validates a CPF, with or without separators.
//
// Invalid CPFs are reported in the verdict, this function does not throw.
ValidationResult Validate(std::string_view raw,
                          ValidationOptions const& options = {});

// Computes the two check digits for the first nine digits of a CPF.
//
// @throws std::invalid_argument if @p base does not normalize to 9 digits.
std::pair<int, int> ComputeCheckDigits(std::string_view base);

// Appends the check digits to a 9-digit base.
//
// @throws std::invalid_argument if @p base does not normalize to 9 digits.
std::string CompleteCpf(std::string_view base);

// Formats an 11-digit CPF as `XXX.XXX.XXX-XX`. Formatting does not check the
// check digits.
//
// @throws std::invalid_argument if @p raw does not normalize to 11 digits.
std::string FormatCpf(std::string_view raw);

// The federation units served by the tax office encoded in the ninth digit.
//
// @throws std::invalid_argument if @p raw does not normalize to 11 digits.
std::vector<std::string> FiscalRegion(std::string_view raw);

}  // namespace cpf_validation

#endif  // CPF_VALIDATION_CPF_VALIDATOR_H
