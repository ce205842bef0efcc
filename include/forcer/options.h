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

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

/**
 * @file options.h
 *
 * @brief Settings that control the forcing passes.
 */

namespace forcer {

/**
 * Debug verbosity levels keyed by dotted tags.
 *
 * A tag is enabled at `level` if the longest configured key that is a
 * dotted prefix of the tag has a level of at least `level`. `tc` thus
 * covers `tc.force`, but `tc.f` does not.
 */
class Verbosity {
 public:
  void set(std::string key, int level);

  bool enabled(std::string_view tag, int level) const;

  /**
   * Parses a comma-separated list of `tag:level` entries.
   *
   * Throws std::invalid_argument on a malformed entry.
   */
  static Verbosity parse(std::string_view text);

 private:
  std::map<std::string, int, std::less<>> levels_;
};

struct Options {
  // When false, every argument is reported as not forced.
  bool forcing = true;
  // Limit on the nesting of patterns handled by the forcing passes.
  std::size_t max_depth = 1024;
  Verbosity verbosity;
};

}  // namespace forcer
