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
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "forcer/location.h"
#include "forcer/modality.h"
#include "forcer/options.h"
#include "forcer/pattern.h"
#include "forcer/telescope.h"
#include "forcer/term.h"

/**
 * @file forcing.h
 *
 * @brief Forcing analysis of constructor types and the forcing translation
 * of clause patterns.
 *
 * A constructor argument is forced if it occurs as a variable in an index
 * of the constructor's target type: `n` in `fzero : (n : Nat) → Fin (suc
 * n)`. Forced arguments can be recovered from the type and need not be
 * matched on or stored at runtime. The translation turns patterns in
 * forced positions into dot patterns and moves whatever they bound to a
 * dot pattern elsewhere in the clause that carries the same term, so that
 *
 *   proj .(suc n) (fzero n)
 *
 * becomes
 *
 *   proj (suc n) (fzero .n)
 */

namespace forcer {

class Reporter;
class Signature;

/** Error thrown when a clause cannot be translated. */
class ForcingError : public std::exception {
 public:
  ForcingError(std::string msg, const Location& location);

  virtual const char* what() const noexcept override {
    return full_msg.c_str();
  }

  const std::string msg;
  const Location location;
  const std::string full_msg;
};

/** An occurrence of variable `index` at a position of modality `modality`. */
struct forced_variable_t {
  Modality modality;
  std::size_t index;

  bool operator==(const forced_variable_t&) const = default;
};

/**
 * The variables of a normalized term that are determined by its value.
 *
 * Only bare variables and constructor arguments are looked at; variables
 * under definitions, projections or path applications are not forced.
 */
std::vector<forced_variable_t> forced_variables(const Term& t);
std::vector<forced_variable_t> forced_variables(const Elims& es);
std::vector<forced_variable_t> forced_variables(const Elim& e);

/** The arguments in positions that are not forced. */
std::vector<Arg> unforced_arguments(const ForcedAnnotations& forced,
                                    const std::vector<Arg>& args);

class ForcerImpl;

/**
 * Runs the forcing analysis and translation against a signature.
 *
 * The signature must hold the forcing annotations of every constructor and
 * function that occurs in the patterns being translated.
 */
class Forcer {
 public:
  Forcer(const Signature& signature, Reporter& reporter, Options options = {});
  ~Forcer();

  const Options& options() const;

  /**
   * Decides which arguments of constructor `name` of type `type` are
   * forced.
   *
   * Returns one annotation per argument of the type, including path
   * dimensions. Throws std::logic_error if the target of `type` is not a
   * data type of the signature.
   */
  ForcedAnnotations compute_forcing_annotations(std::string_view name,
                                                const TermPtr& type,
                                                const Location& location = {});

  struct dot_forced_t {
    PatternList patterns;
    // Patterns removed from forced positions that must be bound elsewhere.
    std::vector<PatternPtr> rebind;
  };

  /** Replaces the patterns in forced positions by dot patterns. */
  dot_forced_t dot_forced_patterns(const PatternList& ps);

  /**
   * Moves `target` into the dot pattern of `ps` that carries its term.
   *
   * Throws ForcingError if there is more than one such place.
   */
  PatternList rebind_forced_pattern(const PatternList& ps,
                                    const Pattern& target,
                                    const Location& location = {});

  /** Dots forced patterns and rebinds what they bound until nothing moves. */
  PatternList forcing_translation(const PatternList& ps,
                                  const Location& location = {});

  /**
   * Updates the modalities of `delta`, the telescope of the variables bound
   * by `ps`, to the positions they are bound in after translation.
   */
  Telescope force_translate_telescope(const Telescope& delta,
                                      const PatternList& ps,
                                      const Location& location = {});

  struct translated_clause_t {
    Telescope telescope;
    PatternList patterns;
  };

  /**
   * Translates the patterns of a clause once and updates its telescope to
   * match.
   */
  translated_clause_t force_translate_clause(const Telescope& delta,
                                             const PatternList& ps,
                                             const Location& location = {});

 private:
  std::unique_ptr<ForcerImpl> impl_;
};

}  // namespace forcer
