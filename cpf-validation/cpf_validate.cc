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
#include "parse_args.h"
#include <iostream>
#include <stdexcept>

namespace cpf = ::cpf_validation;

int main(int argc, char* argv[]) try {
  auto const args = cpf::ParseArguments(argc, argv, std::cerr);
  return cpf::RunCli(args, std::cin, std::cout);
} catch (std::exception const& ex) {
  std::cerr << "Standard C++ exception thrown: " << ex.what() << "\n";
  return cpf::kExitUsage;
}
