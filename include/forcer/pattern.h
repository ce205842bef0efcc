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
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "forcer/modality.h"
#include "forcer/term.h"

/**
 * @file pattern.h
 *
 * @brief Clause patterns over de Bruijn-numbered pattern variables.
 */

namespace forcer {

class Signature;

/** A pattern variable: a display name and a de Bruijn index. */
struct PatVar {
  std::string name;
  std::size_t index;

  bool operator==(const PatVar&) const = default;
};

class Pattern;
using PatternPtr = std::shared_ptr<const Pattern>;

/** A sub-pattern with the modality of its position and an optional name. */
struct NamedArg {
  Modality modality;
  std::optional<std::string> name;
  PatternPtr pattern;
};

bool operator==(const NamedArg& l, const NamedArg& r);

using PatternList = std::vector<NamedArg>;

struct ConPatternInfo {
  // Set on constructor patterns rebuilt from a dot pattern's term: such a
  // match only exposes a binding and never fails.
  bool lazy = false;

  bool operator==(const ConPatternInfo&) const = default;
};

/**
 * A pattern of a clause's left-hand side.
 *
 * Shapes:
 *  - Variable: binds a pattern variable.
 *  - Dotted: a placeholder carrying a term; matches anything, binds nothing.
 *  - Constructor: matches a constructor and its arguments.
 *  - Literal: matches a literal.
 *  - Projection: a copattern projecting a record field.
 *  - FunctionClause: a defined function applied to sub-patterns.
 *  - PathApplication: a path applied to an interval variable, with the
 *    path's endpoints.
 */
class Pattern {
 public:
  struct variable_t {
    PatVar var;
  };

  struct dotted_t {
    TermPtr term;
  };

  struct constructor_t {
    std::string name;
    ConPatternInfo info;
    PatternList args;
  };

  struct literal_t {
    Literal value;
  };

  struct projection_t {
    std::string name;
  };

  struct function_t {
    std::string name;
    PatternList args;
  };

  struct path_application_t {
    TermPtr lhs;
    TermPtr rhs;
    PatVar var;
  };

  using repr = std::variant<variable_t, dotted_t, constructor_t, literal_t,
                            projection_t, function_t, path_application_t>;

  static PatternPtr variable(PatVar var);
  static PatternPtr dotted(TermPtr term);
  static PatternPtr constructor(std::string name, ConPatternInfo info,
                                PatternList args);
  static PatternPtr constructor(std::string name, PatternList args = {});
  static PatternPtr literal(Literal value);
  static PatternPtr projection(std::string name);
  static PatternPtr function(std::string name, PatternList args);
  static PatternPtr path_application(TermPtr lhs, TermPtr rhs, PatVar var);

  bool is_variable() const;
  bool is_dotted() const;
  bool is_constructor() const;
  bool is_literal() const;
  bool is_projection() const;
  bool is_function() const;
  bool is_path_application() const;

  // is_variable() must be true.
  const PatVar& var() const;
  // is_dotted() must be true.
  const TermPtr& term() const;
  // is_constructor() or is_function() must be true.
  const std::string& name() const;
  const PatternList& args() const;

  const repr& get() const { return repr_; }

  friend bool operator==(const Pattern& l, const Pattern& r);

 private:
  repr repr_;

 public:
  explicit Pattern(repr r);
};

/** The same argument with a different pattern. */
NamedArg with_pattern(const NamedArg& arg, PatternPtr pattern);

/**
 * The term a pattern matches.
 *
 * Throws std::logic_error for projection patterns, which stand for an
 * elimination rather than a term.
 */
TermPtr pattern_to_term(const Pattern& p);

/**
 * The eliminations a pattern list stands for: projection and path
 * application patterns turn into projections and path applications,
 * everything else into an application.
 */
Elims patterns_to_elims(const PatternList& ps);

/**
 * Whether `p` rebinds `q`.
 *
 * Structural equality, except that a variable rebinds any dot pattern and
 * variables are compared by index only.
 */
bool rebinds(const Pattern& p, const Pattern& q);

/** True if `p` binds at least one pattern variable. */
bool binds_variables(const Pattern& p);

/** Number of pattern nodes in `p`. */
std::size_t pattern_size(const Pattern& p);

using pattern_var_modality_t = std::pair<PatVar, Modality>;

/**
 * The variables bound by `ps` with the modality of the position binding
 * them, composed along the path from the root.
 */
std::vector<pattern_var_modality_t> pattern_var_modalities(
    const PatternList& ps);

/** Names of the variables bound by `ps`, indexed by de Bruijn index. */
std::vector<std::string> pattern_context(const PatternList& ps);

std::string print_pattern(const Pattern& p,
                          const std::vector<std::string>& context = {});

/** Prints the patterns of a clause, separated by spaces. */
std::string print_patterns(const PatternList& ps);
std::string print_patterns(const PatternList& ps,
                           const std::vector<std::string>& context);

/**
 * Prints the patterns of a clause, omitting dot patterns in forced
 * constructor and function argument positions.
 */
std::string print_patterns(const PatternList& ps, const Signature& signature);

}  // namespace forcer
