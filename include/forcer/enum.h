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

#include <fmt/format.h>

/** Declares an enum and functions that convert enum values to text.
 *
 * # Usage
 * Define a macro that takes two arguments, `DECLARE` and `X`, and
 * expands into zero or more declarations `DECLARE(ENUMERATOR, X)`.
 * Pass the name of the enum and the list to `FORCER_ENUM_WITH_TEXT`.
 *
 * # Example
 *
 *     #define IS_FORCED_LIST(DECLARE, X) \
 *         DECLARE(Forced, X) \
 *         DECLARE(NotForced, X)
 *     FORCER_ENUM_WITH_TEXT(IsForced, IS_FORCED_LIST)
 *
 * expands into an `enum class IsForced` with the enumerators `Forced`
 * and `NotForced` and a function
 *
 *    constexpr const char* IsForcedText(IsForced val);
 *
 * returning the enumerator's name.
 */
#define FORCER_ENUM_WITH_TEXT(Name, LIST)                        \
  enum class Name { LIST(FORCER_ENUM_WITH_TEXT_ENTRY, unused) }; \
  constexpr const char* Name##Text(Name val) {                   \
    switch (val) { LIST(FORCER_ENUM_WITH_TEXT_CASE, Name) }      \
    return nullptr;                                              \
  }

/**
 * Defines a specialization of fmt::formatter for the given enum.
 *
 * Must be used outside of any namespace.
 */
#define FORCER_ENUM_WITH_TEXT_FORMATTER(Name)                       \
  template <>                                                       \
  struct fmt::formatter<Name> : formatter<std::string_view> {       \
    template <typename FormatContext>                               \
    auto format(Name val, FormatContext& ctx) const {               \
      return formatter<std::string_view>::format(Name##Text(val), ctx); \
    }                                                               \
  };

#define FORCER_ENUM_WITH_TEXT_ENTRY(N, X) N,

#define FORCER_ENUM_WITH_TEXT_CASE(N, X) \
  case X::N:                             \
    return #N;
