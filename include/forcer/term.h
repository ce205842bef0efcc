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

#include <gmpxx.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "forcer/modality.h"

/**
 * @file term.h
 *
 * @brief Normalized terms of the core language, as produced by the type
 * checker.
 *
 * Terms are immutable and shared. Variables are de Bruijn indices counted
 * from the innermost binder. Only variables and constructor applications
 * matter to forcing; the remaining shapes are carried so that constructor
 * types and dot patterns can be represented faithfully.
 */

namespace forcer {

class Term;
using TermPtr = std::shared_ptr<const Term>;

using Literal =
    std::variant<mpz_class, std::uint64_t, double, char32_t, std::string>;

std::string print_literal(const Literal& lit);

/** An argument together with the modality of the position it is passed to. */
struct Arg {
  Modality modality;
  TermPtr term;
};

bool operator==(const Arg& l, const Arg& r);

/** Application to an argument. */
struct Apply {
  Arg arg;
};

/** Projection of a record field. */
struct Proj {
  std::string name;
};

/** Application of a path to an interval point, with the path's endpoints. */
struct IApply {
  TermPtr lhs;
  TermPtr rhs;
  TermPtr point;
};

bool operator==(const Apply& l, const Apply& r);
bool operator==(const Proj& l, const Proj& r);
bool operator==(const IApply& l, const IApply& r);

using Elim = std::variant<Apply, Proj, IApply>;
using Elims = std::vector<Elim>;

/** A binding of a Pi type or telescope. */
struct Dom {
  std::string name;
  TermPtr type;
  Modality modality;
};

bool operator==(const Dom& l, const Dom& r);

/** The name of the interval type that path binders range over. */
inline constexpr std::string_view INTERVAL = "I";

class Term {
 public:
  struct var_t {
    std::size_t index;
    Elims elims;
  };

  struct con_t {
    std::string name;
    Elims elims;
  };

  // Data types, records, functions and postulates.
  struct def_t {
    std::string name;
    Elims elims;
  };

  struct lit_t {
    Literal value;
  };

  struct lam_t {
    std::string name;
    TermPtr body;
  };

  // The codomain is under the binder introduced by dom.
  struct pi_t {
    Dom dom;
    TermPtr codomain;
  };

  // A path type `PathP (λ name → family) lhs rhs`; family is under the
  // interval binder.
  struct path_t {
    std::string name;
    TermPtr family;
    TermPtr lhs;
    TermPtr rhs;
  };

  struct sort_t {
    std::size_t level;
  };

  using repr =
      std::variant<var_t, con_t, def_t, lit_t, lam_t, pi_t, path_t, sort_t>;

  static TermPtr var(std::size_t index, Elims elims = {});
  static TermPtr con(std::string name, Elims elims = {});
  static TermPtr def(std::string name, Elims elims = {});
  static TermPtr lit(Literal value);
  static TermPtr lam(std::string name, TermPtr body);
  static TermPtr pi(Dom dom, TermPtr codomain);
  static TermPtr path(std::string name, TermPtr family, TermPtr lhs,
                      TermPtr rhs);
  static TermPtr sort(std::size_t level = 0);
  static TermPtr interval();

  bool is_var() const;
  bool is_con() const;
  bool is_def() const;
  bool is_lit() const;
  bool is_pi() const;
  bool is_path() const;

  // The is_* predicate for the requested shape must be true.
  const var_t& as_var() const;
  const con_t& as_con() const;
  const def_t& as_def() const;
  const pi_t& as_pi() const;
  const path_t& as_path() const;

  const repr& get() const { return repr_; }

  friend bool operator==(const Term& l, const Term& r);

 private:
  repr repr_;

 public:
  explicit Term(repr r);
};

Elim apply(TermPtr term, Modality modality = {});

/**
 * The arguments of an elimination list consisting only of applications.
 *
 * Returns nullopt if any elimination is a projection or path application.
 */
std::optional<std::vector<Arg>> all_apply_elims(const Elims& elims);

/**
 * Prints a term to string.
 *
 * `context[i]` names the variable with de Bruijn index `i`; variables
 * without a (non-empty) name print as `@i`.
 */
std::string print_term(const Term& t,
                       const std::vector<std::string>& context = {});

/** Prints a binding as `(x : A)`, prefixed by its modality if not default. */
std::string print_dom(const Dom& dom,
                      const std::vector<std::string>& context = {});

}  // namespace forcer
