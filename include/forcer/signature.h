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
#include <vector>

#include "forcer/enum.h"
#include "forcer/modality.h"
#include "forcer/term.h"

namespace forcer {

#define DEFINITION_KIND_LIST(DECLARE, X) \
  DECLARE(DataType, X)                   \
  DECLARE(Constructor, X)                \
  DECLARE(Function, X)
FORCER_ENUM_WITH_TEXT(DefinitionKind, DEFINITION_KIND_LIST)

/** What the checker knows about a global name. */
struct Definition {
  std::string name;
  DefinitionKind kind;
  // May be null for data types registered without a type.
  TermPtr type;

  // Constructors and functions: one annotation per argument.
  ForcedAnnotations forced;

  // Constructors: the data type constructed.
  std::string data;

  // Data types: constructors in declaration order.
  std::vector<std::string> constructors;
  // Data types: whether values are determined by their fields.
  bool eta_equality = false;
};

/**
 * Read access to global definitions, keyed by name.
 *
 * A name that reaches the forcing pass has been resolved by the type
 * checker, so looking up an unknown name is an internal error.
 */
class Signature {
 public:
  virtual ~Signature();

  virtual bool contains(std::string_view name) const = 0;

  /** Throws std::logic_error if `name` is not defined. */
  virtual const Definition& lookup(std::string_view name) const = 0;

  /** The forcing annotations of a constructor or function. */
  const ForcedAnnotations& forced_annotations(std::string_view name) const;

  bool is_data_type(std::string_view name) const;

  /**
   * True if `name` is the only constructor of a data type with eta
   * equality. Matching on such a constructor never discriminates.
   */
  bool is_eta_constructor(std::string_view name) const;
};

/** A Signature held in memory, populated as declarations are checked. */
class MemorySignature : public Signature {
 public:
  bool contains(std::string_view name) const override;
  const Definition& lookup(std::string_view name) const override;

  // The add_* functions throw std::invalid_argument if `name` is already
  // defined.
  void add_data(std::string name, TermPtr type = nullptr,
                bool eta_equality = false);
  /** Throws std::logic_error if `data` is not a data type. */
  void add_constructor(std::string name, std::string data, TermPtr type,
                       ForcedAnnotations forced = {});
  void add_function(std::string name, TermPtr type = nullptr,
                    ForcedAnnotations forced = {});

  /** Replaces the cached forcing annotations of a constructor or function. */
  void set_forced(std::string_view name, ForcedAnnotations forced);

 private:
  std::map<std::string, Definition, std::less<>> definitions_;

  Definition& add(std::string name, DefinitionKind kind, TermPtr type);
};

}  // namespace forcer

FORCER_ENUM_WITH_TEXT_FORMATTER(forcer::DefinitionKind)
