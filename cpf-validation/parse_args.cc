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

#include "parse_args.h"
#include <boost/program_options.hpp>
#include <ostream>
#include <stdexcept>
#include <string>

namespace cpf_validation {

namespace po = ::boost::program_options;

ParseResult ParseArguments(int argc, char const* const argv[],
                           std::ostream& usage) {
  po::positional_options_description positional;
  positional.add("cpf", -1);
  po::options_description desc("Validate Brazilian CPF numbers");
  // The following empty line comments are for readability.
  desc.add_options()
      //
      ("help,h", "produce help message")
      //
      ("cpf", po::value<std::vector<std::string>>(),
       "the CPF numbers to validate, with or without separators")
      //
      ("stdin", po::bool_switch(), "read one CPF per line from stdin")
      //
      ("format", po::value<std::string>()->default_value("text"),
       "the output format (text|json)")
      //
      ("allow-repeated-digits", po::bool_switch(),
       "accept CPFs with eleven identical digits")
      //
      ("complete", po::value<std::string>(),
       "print the CPF for a 9-digit base, instead of validating");

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

  ParseResult result;
  if (vm.count("help") || argc == 1) {
    usage << "Usage: " << argv[0] << " [options] [cpf...]\n";
    usage << desc;
    result.help = true;
    return result;
  }

  po::notify(vm);
  auto const format = vm["format"].as<std::string>();
  if (format == "text") {
    result.format = OutputFormat::kText;
  } else if (format == "json") {
    result.format = OutputFormat::kJson;
  } else {
    throw std::runtime_error("format is invalid. it must be one of: text|json");
  }
  if (vm.count("cpf")) {
    result.candidates = vm["cpf"].as<std::vector<std::string>>();
  }
  result.read_stdin = vm["stdin"].as<bool>();
  result.options.reject_repeated_digits =
      !vm["allow-repeated-digits"].as<bool>();
  if (vm.count("complete")) {
    result.complete = vm["complete"].as<std::string>();
    if (!result.candidates.empty() || result.read_stdin) {
      throw std::runtime_error(
          "--complete cannot be combined with CPFs to validate");
    }
    return result;
  }

  if (result.candidates.empty() && !result.read_stdin) {
    throw std::runtime_error("no CPF to validate, use --stdin or list them");
  }
  return result;
}

}  // namespace cpf_validation
