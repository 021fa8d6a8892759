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
#include "structured_log.h"
#include "validation_config.h"
#include <google/cloud/functions/framework.h>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace gcf = ::google::cloud::functions;
namespace cpf = ::cpf_validation;

int main(int argc, char* argv[]) try {
  auto config = cpf::ConfigFromEnvironment();
  auto& logger = cpf::DefaultLogger();
  logger.set_min_severity(config.log_level);
  logger.Log(cpf::Severity::kDebug, "starting CPF validation function",
             {{"reject_repeated_digits",
               config.options.reject_repeated_digits}});
  return gcf::Run(argc, argv,
                  cpf::MakeCpfValidationFunction(std::move(config), logger));
} catch (std::exception const& ex) {
  std::cerr << "Standard C++ exception thrown: " << ex.what() << "\n";
  return 1;
}
