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

#include "forcer/checker.h"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "forcer/reporter.h"
#include "private/overloaded.h"

namespace forcer {

Checker::Checker(Reporter& reporter, Options options)
    : reporter_(reporter), forcer_(signature_, reporter, std::move(options)) {}

bool Checker::check(const Declaration& decl) {
  const auto& location =
      std::visit([](const auto& d) -> const Location& { return d.location; },
                 decl);
  try {
    std::visit(overloaded{[this](const DataDecl& d) { check_data(d); },
                          [this](const FunctionDecl& f) { check_function(f); }},
               decl);
  } catch (ForcingError& e) {
    reporter_.report_error(e.location, e.msg);
    return false;
  } catch (std::invalid_argument& e) {
    reporter_.report_error(location, e.what());
    return false;
  }
  return true;
}

void Checker::check_data(const DataDecl& decl) {
  std::set<std::string_view> names{decl.name};
  for (const auto& c : decl.constructors) {
    if (!names.insert(c.name).second) {
      throw std::invalid_argument(fmt::format(
          "Constructor {} is declared twice in {}", c.name, decl.name));
    }
  }
  for (const auto name : names) {
    if (signature_.contains(name)) {
      throw std::invalid_argument(fmt::format(
          "{} is already defined as a {}", name, signature_.lookup(name).kind));
    }
  }

  signature_.add_data(decl.name, decl.type, decl.eta_equality);
  for (const auto& c : decl.constructors) {
    auto forced = forcer_.compute_forcing_annotations(c.name, c.type,
                                                      decl.location);
    reporter_.report_info(
        fmt::format("{} : [{}]", c.name, fmt::join(forced, ", ")));
    signature_.add_constructor(c.name, decl.name, c.type, std::move(forced));
  }
}

void Checker::check_function(const FunctionDecl& decl) {
  signature_.add_function(decl.name, decl.type, decl.forced);

  std::vector<checked_clause_t> checked;
  checked.reserve(decl.clauses.size());
  for (const auto& clause : decl.clauses) {
    auto translated = forcer_.force_translate_clause(
        clause.telescope, clause.patterns, clause.location);
    checked.push_back(
        {std::move(translated.telescope), std::move(translated.patterns)});
  }
  clauses_[decl.name] = std::move(checked);
}

const std::vector<checked_clause_t>& Checker::clauses(
    std::string_view name) const {
  const auto it = clauses_.find(name);
  if (it == clauses_.end()) {
    throw std::logic_error(
        fmt::format("{} is not a checked function", name));
  }
  return it->second;
}

}  // namespace forcer
