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

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "forcer/forcing.h"
#include "forcer/location.h"
#include "forcer/options.h"
#include "forcer/pattern.h"
#include "forcer/signature.h"
#include "forcer/telescope.h"
#include "forcer/term.h"

namespace forcer {

class Reporter;

struct ConstructorDecl {
  std::string name;
  TermPtr type;
};

struct DataDecl {
  Location location;
  std::string name;
  TermPtr type;
  bool eta_equality = false;
  std::vector<ConstructorDecl> constructors;
};

/** A clause, given by the telescope of its pattern variables and its lhs. */
struct Clause {
  Location location;
  Telescope telescope;
  PatternList patterns;
};

struct FunctionDecl {
  Location location;
  std::string name;
  TermPtr type;
  ForcedAnnotations forced;
  std::vector<Clause> clauses;
};

using Declaration = std::variant<DataDecl, FunctionDecl>;

struct checked_clause_t {
  Telescope telescope;
  PatternList patterns;
};

/**
 * Processes declarations in order.
 *
 * Data declarations add their constructors to the signature along with
 * their forcing annotations; function declarations have each clause's
 * patterns and telescope translated.
 */
class Checker {
 public:
  explicit Checker(Reporter& reporter, Options options = {});

  /**
   * Checks one declaration.
   *
   * Errors in the declaration are reported and false is returned. Errors in
   * earlier declarations do not affect later ones, except that a failed
   * declaration may leave its names defined.
   */
  bool check(const Declaration& decl);

  const Signature& signature() const { return signature_; }

  /** The translated clauses of function `name`. */
  const std::vector<checked_clause_t>& clauses(std::string_view name) const;

 private:
  Reporter& reporter_;
  MemorySignature signature_;
  Forcer forcer_;
  std::map<std::string, std::vector<checked_clause_t>, std::less<>> clauses_;

  void check_data(const DataDecl& decl);
  void check_function(const FunctionDecl& decl);
};

}  // namespace forcer
