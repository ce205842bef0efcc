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

#include "forcer/options.h"

#include <fmt/core.h>

#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace forcer {

void Verbosity::set(std::string key, int level) {
  levels_[std::move(key)] = level;
}

namespace {

bool is_dotted_prefix(std::string_view key, std::string_view tag) {
  if (key.empty()) return true;
  if (!tag.starts_with(key)) return false;
  return tag.size() == key.size() || tag[key.size()] == '.';
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
  while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
  return s;
}

}  // namespace

bool Verbosity::enabled(std::string_view tag, int level) const {
  const std::string* best = nullptr;
  int best_level = 0;
  for (const auto& [key, l] : levels_) {
    if (!is_dotted_prefix(key, tag)) continue;
    if (!best || key.size() > best->size()) {
      best = &key;
      best_level = l;
    }
  }
  return best_level >= level;
}

Verbosity Verbosity::parse(std::string_view text) {
  Verbosity result;
  while (!text.empty()) {
    const auto comma = text.find(',');
    const auto entry = trim(text.substr(0, comma));
    text = comma == std::string_view::npos ? std::string_view()
                                           : text.substr(comma + 1);
    if (entry.empty()) continue;
    const auto colon = entry.rfind(':');
    if (colon == std::string_view::npos) {
      throw std::invalid_argument(
          fmt::format("Verbosity entry '{}' has no level", entry));
    }
    const auto key = trim(entry.substr(0, colon));
    const auto number = trim(entry.substr(colon + 1));
    int level = 0;
    const auto [ptr, ec] =
        std::from_chars(number.data(), number.data() + number.size(), level);
    if (ec != std::errc() || ptr != number.data() + number.size() ||
        number.empty()) {
      throw std::invalid_argument(
          fmt::format("Bad verbosity level '{}' for '{}'", number, key));
    }
    result.set(std::string(key), level);
  }
  return result;
}

}  // namespace forcer
