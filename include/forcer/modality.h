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
#include <string>
#include <utility>
#include <vector>

#include "forcer/enum.h"

/**
 * @file modality.h
 *
 * @brief The usage attributes attached to bindings and arguments, and the
 * per-argument forcing annotations of constructors.
 */

namespace forcer {

/**
 * How a binding may be used computationally.
 *
 * Ordered from most to least usable: a relevant binding can stand in for a
 * shape-irrelevant one, which can stand in for an irrelevant one.
 */
#define RELEVANCE_LIST(DECLARE, X) \
  DECLARE(Relevant, X)             \
  DECLARE(NonStrict, X)            \
  DECLARE(Irrelevant, X)
FORCER_ENUM_WITH_TEXT(Relevance, RELEVANCE_LIST)

/**
 * How many times a binding may be used at runtime.
 *
 * Ordered from most to least usable: unrestricted, linear, erased.
 */
#define QUANTITY_LIST(DECLARE, X) \
  DECLARE(Omega, X)               \
  DECLARE(One, X)                 \
  DECLARE(Zero, X)
FORCER_ENUM_WITH_TEXT(Quantity, QUANTITY_LIST)

/** Whether a constructor argument can be recovered from the result indices.
 */
#define IS_FORCED_LIST(DECLARE, X) \
  DECLARE(Forced, X)               \
  DECLARE(NotForced, X)
FORCER_ENUM_WITH_TEXT(IsForced, IS_FORCED_LIST)

/** The combined relevance and quantity of a binding. */
struct Modality {
  Relevance relevance = Relevance::Relevant;
  Quantity quantity = Quantity::Omega;
  // True if the quantity was written by the user rather than inferred.
  bool user_quantity = false;

  /** The neutral element of `combine`. */
  static constexpr Modality unit() {
    return Modality{Relevance::Relevant, Quantity::One, false};
  }

  static constexpr Modality irrelevant() {
    return Modality{Relevance::Irrelevant, Quantity::Omega, false};
  }

  static constexpr Modality erased(bool user_written = false) {
    return Modality{Relevance::Relevant, Quantity::Zero, user_written};
  }

  bool operator==(const Modality&) const = default;
};

Relevance combine(Relevance l, Relevance r);
std::pair<Quantity, bool> combine(Quantity l, bool user_l, Quantity r,
                                  bool user_r);

/**
 * Composes the modality of an enclosing position `outer` with the modality
 * `inner` of something occurring under it.
 *
 * Associative, with `Modality::unit()` as the neutral element.
 */
Modality combine(const Modality& outer, const Modality& inner);

bool more_relevant(Relevance l, Relevance r);
bool more_quantity(Quantity l, Quantity r);

/** True if a binding with modality `l` can be used wherever `r` is required.
 */
bool more_usable(const Modality& l, const Modality& r);

/** True if forcing is allowed to touch an argument with this modality. */
inline bool no_user_quantity(const Modality& m) { return !m.user_quantity; }

using ForcedAnnotations = std::vector<IsForced>;

inline bool is_forced(IsForced f) { return f == IsForced::Forced; }

/**
 * Splits off the annotation for the next argument.
 *
 * Arguments beyond the end of the list are not forced.
 */
std::pair<IsForced, ForcedAnnotations> next_is_forced(
    const ForcedAnnotations& fs);

/** The annotation of argument `i`, `NotForced` past the end of `fs`. */
IsForced forced_at(const ForcedAnnotations& fs, std::size_t i);

std::string print_modality(const Modality& m);

}  // namespace forcer

FORCER_ENUM_WITH_TEXT_FORMATTER(forcer::Relevance)
FORCER_ENUM_WITH_TEXT_FORMATTER(forcer::Quantity)
FORCER_ENUM_WITH_TEXT_FORMATTER(forcer::IsForced)
