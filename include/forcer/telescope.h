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
#include <vector>

#include "forcer/term.h"

namespace forcer {

/**
 * An ordered, typed context.
 *
 * Each entry's type may refer to the entries before it. The entry at
 * position `k` of an `n`-entry telescope is the variable with de Bruijn
 * index `n - 1 - k` in the scope the telescope introduces.
 */
using Telescope = std::vector<Dom>;

/** The de Bruijn index of the variable bound at position `k` of `tel`. */
inline std::size_t index_of_position(const Telescope& tel, std::size_t k) {
  return tel.size() - 1 - k;
}

struct telescope_view_t {
  Telescope telescope;
  // The codomain, in the scope of `telescope`.
  TermPtr target;
};

/**
 * Splits a type into its leading bindings and its codomain.
 *
 * Both Pi types and path types introduce bindings; a path type
 * `PathP (λ i → A) x y` contributes an interval variable `i` and
 * continues with `A`. The type is expected to be normalized; nothing is
 * reduced here.
 */
telescope_view_t telescope_view_path(const TermPtr& type);

std::string print_telescope(const Telescope& tel);

}  // namespace forcer
