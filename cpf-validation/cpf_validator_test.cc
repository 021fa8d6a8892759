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
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cpf_validation {
namespace {

using ::testing::ElementsAre;

TEST(CpfValidatorTest, KnownValid) {
  for (auto const* cpf : {"11144477735", "52998224725", "12345678909"}) {
    SCOPED_TRACE(cpf);
    auto const result = Validate(cpf);
    EXPECT_EQ(result.verdict, Verdict::kValid);
    EXPECT_TRUE(result.valid());
    EXPECT_EQ(result.digits, cpf);
  }
}

TEST(CpfValidatorTest, SeparatorsAreStripped) {
  auto const result = Validate("111.444.777-35");
  EXPECT_EQ(result.verdict, Verdict::kValid);
  EXPECT_EQ(result.digits, "11144477735");

  EXPECT_EQ(Validate("529.982.247-25").verdict, Verdict::kValid);
  EXPECT_EQ(Validate("529982247-25").verdict, Verdict::kValid);
  EXPECT_EQ(Validate("5.2.9.9.8.2.2.4.7.2.5").verdict, Verdict::kValid);
}

TEST(CpfValidatorTest, InvalidFormat) {
  for (auto const* cpf : {"", "1114447773", "111444777355", "111.444.777-3",
                          "111.444.777-3a", "111 444 777 35", "111/444/777/35",
                          "abcdefghijk", " 11144477735", "---..."}) {
    SCOPED_TRACE(cpf);
    EXPECT_EQ(Validate(cpf).verdict, Verdict::kInvalidFormat);
  }
}

TEST(CpfValidatorTest, InvalidChecksum) {
  // The first check digit of 111444777 is 3, the second is 5.
  for (auto const* cpf : {"11144477734", "11144477736", "11144477705",
                          "11144477745", "52998224752", "12345678900"}) {
    SCOPED_TRACE(cpf);
    EXPECT_EQ(Validate(cpf).verdict, Verdict::kInvalidChecksum);
  }
}

TEST(CpfValidatorTest, ChangingACheckDigitInvalidates) {
  std::string const valid = "11144477735";
  for (std::size_t pos : {9, 10}) {
    for (char d = '0'; d <= '9'; ++d) {
      if (d == valid[pos]) continue;
      auto cpf = valid;
      cpf[pos] = d;
      SCOPED_TRACE(cpf);
      EXPECT_EQ(Validate(cpf).verdict, Verdict::kInvalidChecksum);
    }
  }
}

TEST(CpfValidatorTest, RepeatedDigits) {
  for (char d = '0'; d <= '9'; ++d) {
    std::string const cpf(11, d);
    SCOPED_TRACE(cpf);
    EXPECT_EQ(Validate(cpf).verdict, Verdict::kInvalidChecksum);
    // Without the stricter check the arithmetic alone accepts them.
    EXPECT_EQ(Validate(cpf, ValidationOptions{false}).verdict,
              Verdict::kValid);
  }
  EXPECT_EQ(Validate("111.111.111-11").verdict, Verdict::kInvalidChecksum);
}

TEST(CpfValidatorTest, Idempotent) {
  for (auto const* cpf :
       {"111.444.777-35", "11144477734", "1114447773", "00000000000"}) {
    SCOPED_TRACE(cpf);
    auto const first = Validate(cpf);
    auto const second = Validate(cpf);
    EXPECT_EQ(first.verdict, second.verdict);
    EXPECT_EQ(first.digits, second.digits);
    EXPECT_EQ(Validate(first.digits).verdict, first.verdict);
  }
}

TEST(CpfValidatorTest, Normalize) {
  EXPECT_EQ(Normalize("111.444.777-35"), "11144477735");
  EXPECT_EQ(Normalize("..--"), "");
  EXPECT_EQ(Normalize("1 2/3"), "1 2/3");
}

TEST(CpfValidatorTest, VerdictName) {
  EXPECT_EQ(VerdictName(Verdict::kValid), "valid");
  EXPECT_EQ(VerdictName(Verdict::kInvalidFormat), "invalid-format");
  EXPECT_EQ(VerdictName(Verdict::kInvalidChecksum), "invalid-checksum");

  std::ostringstream os;
  os << Verdict::kInvalidChecksum;
  EXPECT_EQ(os.str(), "invalid-checksum");
}

TEST(CpfValidatorTest, ComputeCheckDigits) {
  EXPECT_EQ(ComputeCheckDigits("111444777"), std::make_pair(3, 5));
  EXPECT_EQ(ComputeCheckDigits("529.982.247"), std::make_pair(2, 5));
  // 210 % 11 == 1, so the first check digit is 0.
  EXPECT_EQ(ComputeCheckDigits("123456789"), std::make_pair(0, 9));
  EXPECT_EQ(ComputeCheckDigits("000000000"), std::make_pair(0, 0));

  EXPECT_THROW(ComputeCheckDigits("12345678"), std::invalid_argument);
  EXPECT_THROW(ComputeCheckDigits("1234567890"), std::invalid_argument);
  EXPECT_THROW(ComputeCheckDigits("12345678x"), std::invalid_argument);
}

TEST(CpfValidatorTest, CompleteCpf) {
  EXPECT_EQ(CompleteCpf("529982247"), "52998224725");
  EXPECT_EQ(CompleteCpf("111.444.777"), "11144477735");
  EXPECT_EQ(Validate(CompleteCpf("987654321")).verdict, Verdict::kValid);
  EXPECT_THROW(CompleteCpf(""), std::invalid_argument);
}

TEST(CpfValidatorTest, FormatCpf) {
  EXPECT_EQ(FormatCpf("11144477735"), "111.444.777-35");
  EXPECT_EQ(FormatCpf("111.444.777-35"), "111.444.777-35");
  // Formatting does not look at the check digits.
  EXPECT_EQ(FormatCpf("11144477700"), "111.444.777-00");
  EXPECT_THROW(FormatCpf("123"), std::invalid_argument);
  EXPECT_THROW(FormatCpf("111 444 777 35"), std::invalid_argument);
}

TEST(CpfValidatorTest, FiscalRegion) {
  EXPECT_THAT(FiscalRegion("11144477735"), ElementsAre("ES", "RJ"));
  EXPECT_THAT(FiscalRegion("123.456.789-09"), ElementsAre("PR", "SC"));
  EXPECT_THAT(FiscalRegion("00000000000"), ElementsAre("RS"));
  EXPECT_THAT(FiscalRegion("00000000100"),
              ElementsAre("DF", "GO", "MS", "MT", "TO"));
  EXPECT_THAT(FiscalRegion("00000000800"), ElementsAre("SP"));
  EXPECT_THROW(FiscalRegion("1234"), std::invalid_argument);
}

}  // namespace
}  // namespace cpf_validation
