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

#include "forcer/signature.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace forcer {

Signature::~Signature() = default;

const ForcedAnnotations& Signature::forced_annotations(
    std::string_view name) const {
  return lookup(name).forced;
}

bool Signature::is_data_type(std::string_view name) const {
  return contains(name) && lookup(name).kind == DefinitionKind::DataType;
}

bool Signature::is_eta_constructor(std::string_view name) const {
  const auto& def = lookup(name);
  if (def.kind != DefinitionKind::Constructor) return false;
  const auto& data = lookup(def.data);
  return data.eta_equality && data.constructors.size() == 1;
}

bool MemorySignature::contains(std::string_view name) const {
  return definitions_.find(name) != definitions_.end();
}

const Definition& MemorySignature::lookup(std::string_view name) const {
  const auto it = definitions_.find(name);
  if (it == definitions_.end()) {
    throw std::logic_error(fmt::format("Unknown definition {}", name));
  }
  return it->second;
}

Definition& MemorySignature::add(std::string name, DefinitionKind kind,
                                 TermPtr type) {
  const auto it = definitions_.lower_bound(name);
  if (it != definitions_.end() && it->first == name) {
    throw std::invalid_argument(
        fmt::format("{} is already defined as a {}", name, it->second.kind));
  }
  Definition def{.name = name, .kind = kind, .type = std::move(type)};
  return definitions_.emplace_hint(it, std::move(name), std::move(def))
      ->second;
}

void MemorySignature::add_data(std::string name, TermPtr type,
                               bool eta_equality) {
  add(std::move(name), DefinitionKind::DataType, std::move(type))
      .eta_equality = eta_equality;
}

void MemorySignature::add_constructor(std::string name, std::string data,
                                      TermPtr type, ForcedAnnotations forced) {
  const auto it = definitions_.find(data);
  if (it == definitions_.end() ||
      it->second.kind != DefinitionKind::DataType) {
    throw std::logic_error(
        fmt::format("Constructor {} of {}, which is not a data type", name,
                    data));
  }
  auto& data_def = it->second;
  auto& def = add(name, DefinitionKind::Constructor, std::move(type));
  def.forced = std::move(forced);
  def.data = std::move(data);
  data_def.constructors.push_back(std::move(name));
}

void MemorySignature::add_function(std::string name, TermPtr type,
                                   ForcedAnnotations forced) {
  add(std::move(name), DefinitionKind::Function, std::move(type)).forced =
      std::move(forced);
}

void MemorySignature::set_forced(std::string_view name,
                                 ForcedAnnotations forced) {
  const auto it = definitions_.find(name);
  if (it == definitions_.end()) {
    throw std::logic_error(fmt::format("Unknown definition {}", name));
  }
  if (it->second.kind == DefinitionKind::DataType) {
    throw std::logic_error(
        fmt::format("Data type {} has no forcing annotations", name));
  }
  it->second.forced = std::move(forced);
}

}  // namespace forcer
