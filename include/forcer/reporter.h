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

#pragma once

#include <cstdio>
#include <string_view>

namespace forcer {

struct Location;

class Reporter {
 public:
  virtual ~Reporter();

  virtual void report_error(const Location& location,
                            std::string_view text) = 0;
  virtual void report_warning(const Location& location,
                              std::string_view text) = 0;
  /** Information for the user, such as computed forcing annotations. */
  virtual void report_info(std::string_view text) = 0;
  /**
   * Debug output of the passes, sent only when `tag` is enabled at `level`
   * in the options' verbosity.
   */
  virtual void report_trace(std::string_view tag, int level,
                            std::string_view text) = 0;
};

/** Writes every report to a stdio stream. */
class PrintingReporter : public Reporter {
 public:
  explicit PrintingReporter(std::FILE* out = stderr) : out_(out) {}

  void report_error(const Location& location, std::string_view text) override;
  void report_warning(const Location& location,
                      std::string_view text) override;
  void report_info(std::string_view text) override;
  void report_trace(std::string_view tag, int level,
                    std::string_view text) override;

 private:
  std::FILE* out_;
};

}  // namespace forcer
