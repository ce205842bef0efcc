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

#include "forcer/pattern.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "forcer/signature.h"
#include "private/overloaded.h"

namespace forcer {

bool operator==(const NamedArg& l, const NamedArg& r) {
  return l.modality == r.modality && l.name == r.name &&
         *l.pattern == *r.pattern;
}

Pattern::Pattern(repr r) : repr_(std::move(r)) {}

PatternPtr Pattern::variable(PatVar var) {
  return std::make_shared<const Pattern>(variable_t{std::move(var)});
}

PatternPtr Pattern::dotted(TermPtr term) {
  return std::make_shared<const Pattern>(dotted_t{std::move(term)});
}

PatternPtr Pattern::constructor(std::string name, ConPatternInfo info,
                                PatternList args) {
  return std::make_shared<const Pattern>(
      constructor_t{std::move(name), info, std::move(args)});
}

PatternPtr Pattern::constructor(std::string name, PatternList args) {
  return constructor(std::move(name), ConPatternInfo{}, std::move(args));
}

PatternPtr Pattern::literal(Literal value) {
  return std::make_shared<const Pattern>(literal_t{std::move(value)});
}

PatternPtr Pattern::projection(std::string name) {
  return std::make_shared<const Pattern>(projection_t{std::move(name)});
}

PatternPtr Pattern::function(std::string name, PatternList args) {
  return std::make_shared<const Pattern>(
      function_t{std::move(name), std::move(args)});
}

PatternPtr Pattern::path_application(TermPtr lhs, TermPtr rhs, PatVar var) {
  return std::make_shared<const Pattern>(
      path_application_t{std::move(lhs), std::move(rhs), std::move(var)});
}

bool Pattern::is_variable() const {
  return std::holds_alternative<variable_t>(repr_);
}

bool Pattern::is_dotted() const {
  return std::holds_alternative<dotted_t>(repr_);
}

bool Pattern::is_constructor() const {
  return std::holds_alternative<constructor_t>(repr_);
}

bool Pattern::is_literal() const {
  return std::holds_alternative<literal_t>(repr_);
}

bool Pattern::is_projection() const {
  return std::holds_alternative<projection_t>(repr_);
}

bool Pattern::is_function() const {
  return std::holds_alternative<function_t>(repr_);
}

bool Pattern::is_path_application() const {
  return std::holds_alternative<path_application_t>(repr_);
}

const PatVar& Pattern::var() const { return std::get<variable_t>(repr_).var; }

const TermPtr& Pattern::term() const {
  return std::get<dotted_t>(repr_).term;
}

const std::string& Pattern::name() const {
  if (const auto* c = std::get_if<constructor_t>(&repr_)) return c->name;
  if (const auto* f = std::get_if<function_t>(&repr_)) return f->name;
  throw std::invalid_argument(
      "May only call name() on constructor or function patterns.");
}

const PatternList& Pattern::args() const {
  if (const auto* c = std::get_if<constructor_t>(&repr_)) return c->args;
  if (const auto* f = std::get_if<function_t>(&repr_)) return f->args;
  throw std::invalid_argument(
      "May only call args() on constructor or function patterns.");
}

bool operator==(const Pattern& l, const Pattern& r) {
  if (l.repr_.index() != r.repr_.index()) return false;
  return std::visit(
      overloaded{
          [&](const Pattern::variable_t& a) {
            return a.var == std::get<Pattern::variable_t>(r.repr_).var;
          },
          [&](const Pattern::dotted_t& a) {
            return *a.term == *std::get<Pattern::dotted_t>(r.repr_).term;
          },
          [&](const Pattern::constructor_t& a) {
            const auto& b = std::get<Pattern::constructor_t>(r.repr_);
            return a.name == b.name && a.info == b.info && a.args == b.args;
          },
          [&](const Pattern::literal_t& a) {
            return a.value == std::get<Pattern::literal_t>(r.repr_).value;
          },
          [&](const Pattern::projection_t& a) {
            return a.name == std::get<Pattern::projection_t>(r.repr_).name;
          },
          [&](const Pattern::function_t& a) {
            const auto& b = std::get<Pattern::function_t>(r.repr_);
            return a.name == b.name && a.args == b.args;
          },
          [&](const Pattern::path_application_t& a) {
            const auto& b = std::get<Pattern::path_application_t>(r.repr_);
            return *a.lhs == *b.lhs && *a.rhs == *b.rhs && a.var == b.var;
          }},
      l.repr_);
}

NamedArg with_pattern(const NamedArg& arg, PatternPtr pattern) {
  return NamedArg{arg.modality, arg.name, std::move(pattern)};
}

TermPtr pattern_to_term(const Pattern& p) {
  return std::visit(
      overloaded{
          [](const Pattern::variable_t& v) { return Term::var(v.var.index); },
          [](const Pattern::dotted_t& d) { return d.term; },
          [](const Pattern::constructor_t& c) {
            return Term::con(c.name, patterns_to_elims(c.args));
          },
          [](const Pattern::literal_t& l) { return Term::lit(l.value); },
          [](const Pattern::projection_t& proj) -> TermPtr {
            throw std::logic_error(fmt::format(
                "Projection pattern .{} does not stand for a term", proj.name));
          },
          [](const Pattern::function_t& f) {
            return Term::def(f.name, patterns_to_elims(f.args));
          },
          [](const Pattern::path_application_t& a) {
            return Term::var(a.var.index);
          }},
      p.get());
}

Elims patterns_to_elims(const PatternList& ps) {
  Elims elims;
  elims.reserve(ps.size());
  for (const auto& a : ps) {
    if (a.pattern->is_projection()) {
      elims.push_back(
          Proj{std::get<Pattern::projection_t>(a.pattern->get()).name});
    } else if (a.pattern->is_path_application()) {
      const auto& i = std::get<Pattern::path_application_t>(a.pattern->get());
      elims.push_back(IApply{i.lhs, i.rhs, Term::var(i.var.index)});
    } else {
      elims.push_back(apply(pattern_to_term(*a.pattern), a.modality));
    }
  }
  return elims;
}

namespace {

bool all_rebind(const PatternList& ps, const PatternList& qs) {
  return ps.size() == qs.size() &&
         std::equal(ps.begin(), ps.end(), qs.begin(),
                    [](const NamedArg& p, const NamedArg& q) {
                      return rebinds(*p.pattern, *q.pattern);
                    });
}

}  // namespace

bool rebinds(const Pattern& p, const Pattern& q) {
  if (p.is_variable() && q.is_dotted()) return true;
  if (p.get().index() != q.get().index()) return false;
  return std::visit(
      overloaded{
          [&](const Pattern::variable_t& a) {
            return a.var.index == q.var().index;
          },
          [&](const Pattern::dotted_t& a) { return *a.term == *q.term(); },
          [&](const Pattern::constructor_t& a) {
            return a.name == q.name() && all_rebind(a.args, q.args());
          },
          [&](const Pattern::literal_t& a) {
            return a.value == std::get<Pattern::literal_t>(q.get()).value;
          },
          [&](const Pattern::projection_t& a) {
            return a.name == std::get<Pattern::projection_t>(q.get()).name;
          },
          [&](const Pattern::function_t& a) {
            return a.name == q.name() && all_rebind(a.args, q.args());
          },
          [&](const Pattern::path_application_t& a) {
            const auto& b = std::get<Pattern::path_application_t>(q.get());
            return *a.lhs == *b.lhs && *a.rhs == *b.rhs && a.var == b.var;
          }},
      p.get());
}

bool binds_variables(const Pattern& p) {
  return std::visit(
      overloaded{[](const Pattern::variable_t&) { return true; },
                 [](const Pattern::path_application_t&) { return true; },
                 [](const Pattern::constructor_t& c) {
                   return std::ranges::any_of(c.args, [](const NamedArg& a) {
                     return binds_variables(*a.pattern);
                   });
                 },
                 [](const Pattern::function_t& f) {
                   return std::ranges::any_of(f.args, [](const NamedArg& a) {
                     return binds_variables(*a.pattern);
                   });
                 },
                 [](const auto&) { return false; }},
      p.get());
}

std::size_t pattern_size(const Pattern& p) {
  if (!p.is_constructor() && !p.is_function()) return 1;
  std::size_t size = 1;
  for (const auto& a : p.args()) size += pattern_size(*a.pattern);
  return size;
}

namespace {

void collect_var_modalities(const Pattern& p, const Modality& m,
                            std::vector<pattern_var_modality_t>& out) {
  std::visit(overloaded{[&](const Pattern::variable_t& v) {
                          out.emplace_back(v.var, combine(m, Modality{}));
                        },
                        [&](const Pattern::path_application_t& a) {
                          out.emplace_back(a.var, combine(m, Modality{}));
                        },
                        [&](const Pattern::constructor_t& c) {
                          for (const auto& a : c.args) {
                            collect_var_modalities(
                                *a.pattern, combine(m, a.modality), out);
                          }
                        },
                        [&](const Pattern::function_t& f) {
                          for (const auto& a : f.args) {
                            collect_var_modalities(
                                *a.pattern, combine(m, a.modality), out);
                          }
                        },
                        [](const auto&) {}},
             p.get());
}

}  // namespace

std::vector<pattern_var_modality_t> pattern_var_modalities(
    const PatternList& ps) {
  std::vector<pattern_var_modality_t> out;
  for (const auto& a : ps) collect_var_modalities(*a.pattern, a.modality, out);
  return out;
}

std::vector<std::string> pattern_context(const PatternList& ps) {
  std::vector<std::string> context;
  for (const auto& [x, m] : pattern_var_modalities(ps)) {
    if (x.index >= context.size()) context.resize(x.index + 1);
    context[x.index] = x.name;
  }
  return context;
}

namespace {

class PatternPrinter {
 public:
  PatternPrinter(std::vector<std::string> context, const Signature* signature)
      : context_(std::move(context)), signature_(signature) {}

  std::string& contents() { return contents_; }

  void print(const Pattern& p) {
    std::visit(
        overloaded{[&](const Pattern::variable_t& v) {
                     contents_ += var_name(v.var);
                   },
                   [&](const Pattern::dotted_t& d) {
                     contents_ += ".";
                     term_atom(*d.term);
                   },
                   [&](const Pattern::constructor_t& c) {
                     head(c.name, c.args);
                   },
                   [&](const Pattern::literal_t& l) {
                     contents_ += print_literal(l.value);
                   },
                   [&](const Pattern::projection_t& proj) {
                     contents_ += "." + proj.name;
                   },
                   [&](const Pattern::function_t& f) {
                     contents_ += "(";
                     head(f.name, f.args);
                     contents_ += ")";
                   },
                   [&](const Pattern::path_application_t& a) {
                     contents_ += var_name(a.var);
                   }},
        p.get());
  }

  void print_list(const PatternList& ps) {
    bool first = true;
    for (const auto& a : ps) {
      if (!first) contents_ += " ";
      first = false;
      atom(*a.pattern);
    }
  }

 private:
  std::vector<std::string> context_;
  const Signature* signature_;
  std::string contents_;

  std::string var_name(const PatVar& x) const {
    if (!x.name.empty()) return x.name;
    return fmt::format("@{}", x.index);
  }

  void atom(const Pattern& p) {
    if (p.is_constructor() && !shown(p.name(), p.args()).empty()) {
      contents_ += "(";
      print(p);
      contents_ += ")";
    } else {
      print(p);
    }
  }

  void term_atom(const Term& t) {
    const auto printed = print_term(t, context_);
    const bool simple = std::visit(
        overloaded{[](const Term::var_t& v) { return v.elims.empty(); },
                   [](const Term::con_t& c) { return c.elims.empty(); },
                   [](const Term::def_t& d) { return d.elims.empty(); },
                   [](const Term::lit_t&) { return true; },
                   [](const Term::sort_t&) { return true; },
                   [](const auto&) { return false; }},
        t.get());
    if (simple) {
      contents_ += printed;
    } else {
      fmt::format_to(std::back_inserter(contents_), "({})", printed);
    }
  }

  // The arguments that get printed: dot patterns in forced positions are
  // left out when printing against a signature.
  std::vector<const NamedArg*> shown(const std::string& name,
                                     const PatternList& args) const {
    const ForcedAnnotations* fs = nullptr;
    if (signature_ && signature_->contains(name)) {
      fs = &signature_->forced_annotations(name);
    }
    std::vector<const NamedArg*> out;
    for (std::size_t i = 0; i < args.size(); ++i) {
      if (fs && is_forced(forced_at(*fs, i)) && args[i].pattern->is_dotted()) {
        continue;
      }
      out.push_back(&args[i]);
    }
    return out;
  }

  void head(const std::string& name, const PatternList& args) {
    contents_ += name;
    for (const auto* a : shown(name, args)) {
      contents_ += " ";
      atom(*a->pattern);
    }
  }
};

}  // namespace

std::string print_pattern(const Pattern& p,
                          const std::vector<std::string>& context) {
  PatternPrinter printer(context, nullptr);
  printer.print(p);
  return std::move(printer.contents());
}

std::string print_patterns(const PatternList& ps) {
  PatternPrinter printer(pattern_context(ps), nullptr);
  printer.print_list(ps);
  return std::move(printer.contents());
}

std::string print_patterns(const PatternList& ps,
                           const std::vector<std::string>& context) {
  PatternPrinter printer(context, nullptr);
  printer.print_list(ps);
  return std::move(printer.contents());
}

std::string print_patterns(const PatternList& ps, const Signature& signature) {
  PatternPrinter printer(pattern_context(ps), &signature);
  printer.print_list(ps);
  return std::move(printer.contents());
}

}  // namespace forcer
