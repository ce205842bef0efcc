// Copyright 2024 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "forcer/reporter.h"

#include <fmt/core.h>

#include <string_view>

#include "forcer/location.h"

namespace forcer {

Reporter::~Reporter() = default;

void PrintingReporter::report_error(const Location& location,
                                    std::string_view text) {
  fmt::print(out_, "{}:{}: error: {}\n", location.filename, location.line,
             text);
}

void PrintingReporter::report_warning(const Location& location,
                                      std::string_view text) {
  fmt::print(out_, "{}:{}: warning: {}\n", location.filename, location.line,
             text);
}

void PrintingReporter::report_info(std::string_view text) {
  fmt::print(out_, "{}\n", text);
}

void PrintingReporter::report_trace(std::string_view tag, int level,
                                    std::string_view text) {
  fmt::print(out_, "[{}:{}] {}\n", tag, level, text);
}

}  // namespace forcer
