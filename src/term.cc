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

#include "forcer/term.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "private/overloaded.h"

namespace forcer {

bool operator==(const Arg& l, const Arg& r) {
  return l.modality == r.modality && *l.term == *r.term;
}

bool operator==(const Apply& l, const Apply& r) { return l.arg == r.arg; }

bool operator==(const Proj& l, const Proj& r) { return l.name == r.name; }

bool operator==(const IApply& l, const IApply& r) {
  return *l.lhs == *r.lhs && *l.rhs == *r.rhs && *l.point == *r.point;
}

bool operator==(const Dom& l, const Dom& r) {
  return l.name == r.name && l.modality == r.modality && *l.type == *r.type;
}

Term::Term(repr r) : repr_(std::move(r)) {}

TermPtr Term::var(std::size_t index, Elims elims) {
  return std::make_shared<const Term>(var_t{index, std::move(elims)});
}

TermPtr Term::con(std::string name, Elims elims) {
  return std::make_shared<const Term>(con_t{std::move(name), std::move(elims)});
}

TermPtr Term::def(std::string name, Elims elims) {
  return std::make_shared<const Term>(def_t{std::move(name), std::move(elims)});
}

TermPtr Term::lit(Literal value) {
  return std::make_shared<const Term>(lit_t{std::move(value)});
}

TermPtr Term::lam(std::string name, TermPtr body) {
  return std::make_shared<const Term>(lam_t{std::move(name), std::move(body)});
}

TermPtr Term::pi(Dom dom, TermPtr codomain) {
  return std::make_shared<const Term>(
      pi_t{std::move(dom), std::move(codomain)});
}

TermPtr Term::path(std::string name, TermPtr family, TermPtr lhs,
                   TermPtr rhs) {
  return std::make_shared<const Term>(path_t{
      std::move(name), std::move(family), std::move(lhs), std::move(rhs)});
}

TermPtr Term::sort(std::size_t level) {
  return std::make_shared<const Term>(sort_t{level});
}

TermPtr Term::interval() { return def(std::string(INTERVAL)); }

bool Term::is_var() const { return std::holds_alternative<var_t>(repr_); }
bool Term::is_con() const { return std::holds_alternative<con_t>(repr_); }
bool Term::is_def() const { return std::holds_alternative<def_t>(repr_); }
bool Term::is_lit() const { return std::holds_alternative<lit_t>(repr_); }
bool Term::is_pi() const { return std::holds_alternative<pi_t>(repr_); }
bool Term::is_path() const { return std::holds_alternative<path_t>(repr_); }

const Term::var_t& Term::as_var() const { return std::get<var_t>(repr_); }
const Term::con_t& Term::as_con() const { return std::get<con_t>(repr_); }
const Term::def_t& Term::as_def() const { return std::get<def_t>(repr_); }
const Term::pi_t& Term::as_pi() const { return std::get<pi_t>(repr_); }
const Term::path_t& Term::as_path() const { return std::get<path_t>(repr_); }

bool operator==(const Term& l, const Term& r) {
  if (l.repr_.index() != r.repr_.index()) return false;
  return std::visit(
      overloaded{
          [&](const Term::var_t& a) {
            const auto& b = std::get<Term::var_t>(r.repr_);
            return a.index == b.index && a.elims == b.elims;
          },
          [&](const Term::con_t& a) {
            const auto& b = std::get<Term::con_t>(r.repr_);
            return a.name == b.name && a.elims == b.elims;
          },
          [&](const Term::def_t& a) {
            const auto& b = std::get<Term::def_t>(r.repr_);
            return a.name == b.name && a.elims == b.elims;
          },
          [&](const Term::lit_t& a) {
            return a.value == std::get<Term::lit_t>(r.repr_).value;
          },
          [&](const Term::lam_t& a) {
            const auto& b = std::get<Term::lam_t>(r.repr_);
            return a.name == b.name && *a.body == *b.body;
          },
          [&](const Term::pi_t& a) {
            const auto& b = std::get<Term::pi_t>(r.repr_);
            return a.dom == b.dom && *a.codomain == *b.codomain;
          },
          [&](const Term::path_t& a) {
            const auto& b = std::get<Term::path_t>(r.repr_);
            return a.name == b.name && *a.family == *b.family &&
                   *a.lhs == *b.lhs && *a.rhs == *b.rhs;
          },
          [&](const Term::sort_t& a) {
            return a.level == std::get<Term::sort_t>(r.repr_).level;
          }},
      l.repr_);
}

Elim apply(TermPtr term, Modality modality) {
  return Apply{Arg{modality, std::move(term)}};
}

std::optional<std::vector<Arg>> all_apply_elims(const Elims& elims) {
  std::vector<Arg> args;
  args.reserve(elims.size());
  for (const auto& e : elims) {
    const auto* a = std::get_if<Apply>(&e);
    if (!a) return std::nullopt;
    args.push_back(a->arg);
  }
  return args;
}

std::string print_literal(const Literal& lit) {
  return std::visit(
      overloaded{
          [](const mpz_class& n) { return n.get_str(); },
          [](std::uint64_t w) { return fmt::format("{}", w); },
          [](double d) { return fmt::format("{}", d); },
          [](char32_t c) {
            if (c >= 0x20 && c < 0x7f && c != '\'' && c != '\\') {
              return fmt::format("'{}'", static_cast<char>(c));
            }
            return fmt::format("'\\x{:X}'", static_cast<std::uint32_t>(c));
          },
          [](const std::string& s) {
            std::string out = "\"";
            for (char c : s) {
              if (c == '"' || c == '\\') out += '\\';
              out += c;
            }
            out += '"';
            return out;
          }},
      lit);
}

namespace {

std::string modality_prefix(const Modality& m) {
  std::string prefix;
  switch (m.relevance) {
    case Relevance::Relevant:
      break;
    case Relevance::NonStrict:
      prefix += "..";
      break;
    case Relevance::Irrelevant:
      prefix += ".";
      break;
  }
  switch (m.quantity) {
    case Quantity::Omega:
      break;
    case Quantity::One:
      prefix += "@1 ";
      break;
    case Quantity::Zero:
      prefix += "@0 ";
      break;
  }
  return prefix;
}

class TermPrinter {
 public:
  explicit TermPrinter(std::vector<std::string> context)
      : context_(std::move(context)) {}

  std::string& contents() { return contents_; }

  void print(const Term& t) {
    std::visit(
        overloaded{[&](const Term::var_t& v) {
                     head(var_name(v.index), v.elims);
                   },
                   [&](const Term::con_t& c) { head(c.name, c.elims); },
                   [&](const Term::def_t& d) { head(d.name, d.elims); },
                   [&](const Term::lit_t& l) {
                     contents_ += print_literal(l.value);
                   },
                   [&](const Term::lam_t& l) {
                     fmt::format_to(std::back_inserter(contents_), "λ {} → ",
                                    l.name);
                     under(l.name, *l.body);
                   },
                   [&](const Term::pi_t& p) {
                     binding(p.dom);
                     contents_ += " → ";
                     under(p.dom.name, *p.codomain);
                   },
                   [&](const Term::path_t& p) {
                     fmt::format_to(std::back_inserter(contents_),
                                    "PathP (λ {} → ", p.name);
                     under(p.name, *p.family);
                     contents_ += ") ";
                     atom(*p.lhs);
                     contents_ += " ";
                     atom(*p.rhs);
                   },
                   [&](const Term::sort_t& s) {
                     contents_ += "Set";
                     if (s.level) contents_ += std::to_string(s.level);
                   }},
        t.get());
  }

  void binding(const Dom& dom) {
    fmt::format_to(std::back_inserter(contents_), "({}{} : ",
                   modality_prefix(dom.modality),
                   dom.name.empty() ? "_" : dom.name);
    print(*dom.type);
    contents_ += ")";
  }

  void atom(const Term& t) {
    bool simple = std::visit(
        overloaded{[](const Term::var_t& v) { return v.elims.empty(); },
                   [](const Term::con_t& c) { return c.elims.empty(); },
                   [](const Term::def_t& d) { return d.elims.empty(); },
                   [](const Term::lit_t&) { return true; },
                   [](const Term::sort_t&) { return true; },
                   [](const auto&) { return false; }},
        t.get());
    if (simple) {
      print(t);
    } else {
      contents_ += "(";
      print(t);
      contents_ += ")";
    }
  }

 private:
  std::vector<std::string> context_;
  // Names bound inside the term being printed, innermost last.
  std::vector<std::string> binders_;
  std::string contents_;

  std::string var_name(std::size_t index) const {
    if (index < binders_.size()) {
      const auto& name = binders_[binders_.size() - 1 - index];
      if (!name.empty()) return name;
      return fmt::format("@{}", index);
    }
    const std::size_t outer = index - binders_.size();
    if (outer < context_.size() && !context_[outer].empty()) {
      return context_[outer];
    }
    return fmt::format("@{}", outer);
  }

  void under(const std::string& name, const Term& body) {
    binders_.push_back(name);
    print(body);
    binders_.pop_back();
  }

  void head(const std::string& name, const Elims& elims) {
    contents_ += name;
    for (const auto& e : elims) {
      contents_ += " ";
      std::visit(overloaded{[&](const Apply& a) {
                              contents_ += modality_prefix(a.arg.modality);
                              atom(*a.arg.term);
                            },
                            [&](const Proj& p) { contents_ += "." + p.name; },
                            [&](const IApply& i) { atom(*i.point); }},
                 e);
    }
  }
};

}  // namespace

std::string print_dom(const Dom& dom, const std::vector<std::string>& context) {
  TermPrinter printer{context};
  printer.binding(dom);
  return std::move(printer.contents());
}

std::string print_term(const Term& t, const std::vector<std::string>& context) {
  TermPrinter printer{context};
  printer.print(t);
  return std::move(printer.contents());
}

}  // namespace forcer
