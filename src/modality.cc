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

#include "forcer/modality.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace forcer {

namespace {

// Position in the usability order; smaller is more usable.
int rank(Relevance r) {
  switch (r) {
    case Relevance::Relevant:
      return 0;
    case Relevance::NonStrict:
      return 1;
    case Relevance::Irrelevant:
      return 2;
  }
  throw std::logic_error("Unreachable");
}

int rank(Quantity q) {
  switch (q) {
    case Quantity::Omega:
      return 0;
    case Quantity::One:
      return 1;
    case Quantity::Zero:
      return 2;
  }
  throw std::logic_error("Unreachable");
}

}  // namespace

Relevance combine(Relevance l, Relevance r) {
  return rank(l) >= rank(r) ? l : r;
}

std::pair<Quantity, bool> combine(Quantity l, bool user_l, Quantity r,
                                  bool user_r) {
  if (l == Quantity::One) return {r, user_r};
  if (r == Quantity::One) return {l, user_l};
  if (l == Quantity::Zero) return {l, user_l};
  if (r == Quantity::Zero) return {r, user_r};
  return {Quantity::Omega, false};
}

Modality combine(const Modality& outer, const Modality& inner) {
  const auto [q, user] = combine(outer.quantity, outer.user_quantity,
                                 inner.quantity, inner.user_quantity);
  return Modality{combine(outer.relevance, inner.relevance), q, user};
}

bool more_relevant(Relevance l, Relevance r) { return rank(l) <= rank(r); }

bool more_quantity(Quantity l, Quantity r) { return rank(l) <= rank(r); }

bool more_usable(const Modality& l, const Modality& r) {
  return more_relevant(l.relevance, r.relevance) &&
         more_quantity(l.quantity, r.quantity);
}

std::pair<IsForced, ForcedAnnotations> next_is_forced(
    const ForcedAnnotations& fs) {
  if (fs.empty()) return {IsForced::NotForced, {}};
  return {fs.front(), ForcedAnnotations(fs.begin() + 1, fs.end())};
}

IsForced forced_at(const ForcedAnnotations& fs, std::size_t i) {
  return i < fs.size() ? fs[i] : IsForced::NotForced;
}

std::string print_modality(const Modality& m) {
  return fmt::format("({}, {}{})", m.relevance, m.quantity,
                     m.user_quantity ? ", user" : "");
}

}  // namespace forcer
