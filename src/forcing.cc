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

#include "forcer/forcing.h"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "forcer/reporter.h"
#include "forcer/signature.h"
#include "private/overloaded.h"

namespace forcer {

namespace {

constexpr std::string_view kTag = "tc.force";

std::string print_annotations(const ForcedAnnotations& fs) {
  std::vector<std::string_view> names;
  names.reserve(fs.size());
  for (auto f : fs) names.push_back(IsForcedText(f));
  return fmt::format("[{}]", fmt::join(names, ", "));
}

std::string print_var_modalities(
    const std::vector<pattern_var_modality_t>& xms) {
  std::vector<std::string> entries;
  entries.reserve(xms.size());
  for (const auto& [x, m] : xms) {
    entries.push_back(fmt::format("{}@{} : {}", x.name, x.index,
                                  print_modality(m)));
  }
  return fmt::format("[{}]", fmt::join(entries, ", "));
}

/** Elements of `l` left after removing one occurrence of each of `r`. */
std::vector<pattern_var_modality_t> multiset_difference(
    std::vector<pattern_var_modality_t> l,
    const std::vector<pattern_var_modality_t>& r) {
  for (const auto& x : r) {
    const auto it = std::find(l.begin(), l.end(), x);
    if (it != l.end()) l.erase(it);
  }
  return l;
}

// Names for the variables of a clause and of a pattern moved into it.
std::vector<std::string> rebind_context(const PatternList& ps,
                                        const Pattern& target) {
  auto context = pattern_context(ps);
  const PatternList target_list{
      NamedArg{{}, std::nullopt, std::make_shared<const Pattern>(target)}};
  for (const auto& [x, m] : pattern_var_modalities(target_list)) {
    if (x.index >= context.size()) context.resize(x.index + 1);
    if (context[x.index].empty()) context[x.index] = x.name;
  }
  return context;
}

std::size_t total_size(const std::vector<PatternPtr>& ps) {
  std::size_t size = 0;
  for (const auto& p : ps) size += pattern_size(*p);
  return size;
}

}  // namespace

ForcingError::ForcingError(std::string msg, const Location& location)
    : msg(std::move(msg)),
      location(location),
      full_msg(fmt::format("{}:{}: error: {}", this->location.filename,
                           this->location.line, this->msg)) {}

std::vector<forced_variable_t> forced_variables(const Term& t) {
  return std::visit(
      overloaded{[](const Term::var_t& v) {
                   std::vector<forced_variable_t> result;
                   if (v.elims.empty()) {
                     result.push_back({Modality::unit(), v.index});
                   }
                   return result;
                 },
                 [](const Term::con_t& c) { return forced_variables(c.elims); },
                 [](const auto&) { return std::vector<forced_variable_t>(); }},
      t.get());
}

std::vector<forced_variable_t> forced_variables(const Elims& es) {
  std::vector<forced_variable_t> result;
  for (const auto& e : es) {
    auto xs = forced_variables(e);
    result.insert(result.end(), xs.begin(), xs.end());
  }
  return result;
}

std::vector<forced_variable_t> forced_variables(const Elim& e) {
  const auto* a = std::get_if<Apply>(&e);
  if (!a) return {};
  auto xs = forced_variables(*a->arg.term);
  for (auto& x : xs) x.modality = combine(a->arg.modality, x.modality);
  return xs;
}

std::vector<Arg> unforced_arguments(const ForcedAnnotations& forced,
                                    const std::vector<Arg>& args) {
  std::vector<Arg> result;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (!is_forced(forced_at(forced, i))) result.push_back(args[i]);
  }
  return result;
}

class ForcerImpl {
 public:
  ForcerImpl(const Signature& signature, Reporter& reporter, Options options)
      : signature_(signature),
        reporter_(reporter),
        options_(std::move(options)) {}

  ForcedAnnotations compute_forcing_annotations(std::string_view name,
                                                const TermPtr& type);
  Forcer::dot_forced_t dot_forced_patterns(const PatternList& ps);
  PatternList rebind_forced_pattern(const PatternList& ps,
                                    const Pattern& target);
  PatternList forcing_translation(const PatternList& ps);
  Telescope force_translate_telescope(const Telescope& delta,
                                      const PatternList& ps);
  Telescope update_telescope(const Telescope& delta, const PatternList& ps,
                             const PatternList& qs);

  void set_location(const Location& location) { location_ = location; }

 private:
  friend class Forcer;
  friend class Rebinder;

  const Signature& signature_;
  Reporter& reporter_;
  const Options options_;
  Location location_;
  std::size_t depth_ = 0;

  /** Tracks the nesting of the pattern passes. */
  class DepthGuard {
   public:
    explicit DepthGuard(ForcerImpl& forcer) : forcer_(forcer) {
      if (++forcer_.depth_ > forcer_.options_.max_depth) {
        --forcer_.depth_;
        throw ForcingError(
            fmt::format("pattern nesting too deep (limit {})",
                        forcer_.options_.max_depth),
            forcer_.location_);
      }
    }
    ~DepthGuard() { --forcer_.depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    ForcerImpl& forcer_;
  };

  template <typename F>
  void trace(int level, F&& text) {
    if (options_.verbosity.enabled(kTag, level)) {
      reporter_.report_trace(kTag, level, text());
    }
  }

  PatternPtr dot_forced(IsForced f, const PatternPtr& p,
                        std::vector<PatternPtr>& rebind);
  PatternList dot_forced_args(const ForcedAnnotations& fs,
                              const PatternList& args,
                              std::vector<PatternPtr>& rebind);
  bool is_proper_match(const Pattern& p);
  void check_term_depth(const Term& t);
  void check_term_depth(const Elims& es);
};

ForcedAnnotations ForcerImpl::compute_forcing_annotations(
    std::string_view name, const TermPtr& type) {
  if (!options_.forcing) {
    std::size_t n = 0;
    for (const Term* t = type.get(); t && (t->is_pi() || t->is_path());
         t = t->is_pi() ? t->as_pi().codomain.get()
                        : t->as_path().family.get()) {
      ++n;
    }
    return ForcedAnnotations(n, IsForced::NotForced);
  }

  const auto view = telescope_view_path(type);
  const auto& tel = view.telescope;
  const auto n = tel.size();
  std::vector<std::string> context(n);
  for (std::size_t k = 0; k < n; ++k) {
    context[index_of_position(tel, k)] = tel[k].name;
  }
  if (!view.target || !view.target->is_def() ||
      !signature_.is_data_type(view.target->as_def().name)) {
    throw std::logic_error(fmt::format(
        "Constructor {} does not construct a data type: {}", name,
        view.target ? print_term(*view.target, context) : "<null>"));
  }

  check_term_depth(*view.target);
  const auto xs = forced_variables(view.target->as_def().elims);
  ForcedAnnotations forced;
  forced.reserve(n);
  for (std::size_t k = 0; k < n; ++k) {
    const auto i = index_of_position(tel, k);
    const auto& m = tel[k].modality;
    const bool forced_here =
        no_user_quantity(m) && m.relevance != Relevance::Irrelevant &&
        std::any_of(xs.begin(), xs.end(), [&](const forced_variable_t& x) {
          return x.index == i && more_usable(x.modality, m);
        });
    forced.push_back(forced_here ? IsForced::Forced : IsForced::NotForced);
  }

  trace(60, [&] {
    std::vector<std::size_t> indices;
    for (const auto& x : xs) indices.push_back(x.index);
    return fmt::format(
        "Forcing analysis for {}\n  xs          = [{}]\n  forcedArgs  = {}",
        name, fmt::join(indices, ", "), print_annotations(forced));
  });
  return forced;
}

bool ForcerImpl::is_proper_match(const Pattern& p) {
  DepthGuard guard(*this);
  if (p.is_literal() || p.is_function()) return true;
  if (!p.is_constructor()) return false;
  if (!signature_.is_eta_constructor(p.name())) return true;
  return std::any_of(p.args().begin(), p.args().end(),
                     [this](const NamedArg& a) {
                       return is_proper_match(*a.pattern);
                     });
}

// Bounds the nesting of terms reached by the pattern passes and the
// forcing analysis.
void ForcerImpl::check_term_depth(const Term& t) {
  DepthGuard guard(*this);
  const auto check = [this](const TermPtr& u) {
    if (u) check_term_depth(*u);
  };
  std::visit(
      overloaded{[&](const Term::var_t& x) { check_term_depth(x.elims); },
                 [&](const Term::con_t& c) { check_term_depth(c.elims); },
                 [&](const Term::def_t& d) { check_term_depth(d.elims); },
                 [&](const Term::lam_t& l) { check(l.body); },
                 [&](const Term::pi_t& pi) {
                   check(pi.dom.type);
                   check(pi.codomain);
                 },
                 [&](const Term::path_t& path) {
                   check(path.family);
                   check(path.lhs);
                   check(path.rhs);
                 },
                 [](const auto&) {}},
      t.get());
}

void ForcerImpl::check_term_depth(const Elims& es) {
  for (const auto& e : es) {
    if (const auto* a = std::get_if<Apply>(&e)) {
      if (a->arg.term) check_term_depth(*a->arg.term);
    } else if (const auto* i = std::get_if<IApply>(&e)) {
      for (const auto& u : {i->lhs, i->rhs, i->point}) {
        if (u) check_term_depth(*u);
      }
    }
  }
}

PatternPtr ForcerImpl::dot_forced(IsForced f, const PatternPtr& p,
                                  std::vector<PatternPtr>& rebind) {
  DepthGuard guard(*this);
  if (p->is_dotted()) {
    if (p->term()) check_term_depth(*p->term());
    return p;
  }
  if (p->is_projection()) return p;
  if (is_forced(f)) {
    if (is_proper_match(*p) || binds_variables(*p)) rebind.push_back(p);
    return Pattern::dotted(pattern_to_term(*p));
  }
  if (p->is_constructor()) {
    const auto& c = std::get<Pattern::constructor_t>(p->get());
    return Pattern::constructor(
        c.name, c.info,
        dot_forced_args(signature_.forced_annotations(c.name), c.args,
                        rebind));
  }
  if (p->is_function()) {
    return Pattern::function(
        p->name(), dot_forced_args(signature_.forced_annotations(p->name()),
                                   p->args(), rebind));
  }
  return p;
}

PatternList ForcerImpl::dot_forced_args(const ForcedAnnotations& fs,
                                        const PatternList& args,
                                        std::vector<PatternPtr>& rebind) {
  PatternList result;
  result.reserve(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    result.push_back(with_pattern(
        args[i], dot_forced(forced_at(fs, i), args[i].pattern, rebind)));
  }
  return result;
}

Forcer::dot_forced_t ForcerImpl::dot_forced_patterns(const PatternList& ps) {
  Forcer::dot_forced_t result;
  result.patterns = dot_forced_args({}, ps, result.rebind);
  return result;
}

/**
 * One search for the place to move a forced pattern to.
 *
 * Walks the clause depth first, skipping forced positions, and replaces
 * dot patterns whose term is (or, for a constructor term, contains) the
 * target's term.
 */
class Rebinder {
 public:
  Rebinder(ForcerImpl& forcer, const Pattern& target)
      : forcer_(forcer),
        target_(std::make_shared<const Pattern>(target)),
        target_term_(pattern_to_term(target)),
        target_is_var_(target.is_variable()) {}

  PatternList rebind(const ForcedAnnotations& fs, const PatternList& ps);

  std::size_t count() const { return count_; }

 private:
  ForcerImpl& forcer_;
  const PatternPtr target_;
  const TermPtr target_term_;
  const bool target_is_var_;
  std::size_t count_ = 0;
  bool done_ = false;

  struct mk_pat_t {
    PatternPtr pattern;
    // Number of places in the term where the target could go.
    std::size_t candidates = 0;
  };

  mk_pat_t mk_pat(const TermPtr& v);
  PatternPtr rebind_pattern(const PatternPtr& p);
};

PatternList Rebinder::rebind(const ForcedAnnotations& fs,
                             const PatternList& ps) {
  PatternList result;
  result.reserve(ps.size());
  for (std::size_t i = 0; i < ps.size(); ++i) {
    if (done_ || is_forced(forced_at(fs, i))) {
      result.push_back(ps[i]);
      continue;
    }
    if (rebinds(*ps[i].pattern, *target_)) {
      // Already bound here. Counts as the placement unless one was made.
      if (count_ == 0) ++count_;
      done_ = true;
      result.push_back(ps[i]);
      continue;
    }
    result.push_back(with_pattern(ps[i], rebind_pattern(ps[i].pattern)));
  }
  return result;
}

PatternPtr Rebinder::rebind_pattern(const PatternPtr& p) {
  ForcerImpl::DepthGuard guard(forcer_);
  const auto& signature = forcer_.signature_;
  return std::visit(
      overloaded{
          [&](const Pattern::dotted_t& d) {
            auto [q, candidates] = mk_pat(d.term);
            if (!q) return p;
            count_ += candidates;
            if (target_is_var_) done_ = true;
            return q;
          },
          [&](const Pattern::constructor_t& c) {
            return Pattern::constructor(
                c.name, c.info,
                rebind(signature.forced_annotations(c.name), c.args));
          },
          [&](const Pattern::function_t& f) {
            return Pattern::function(
                f.name, rebind(signature.forced_annotations(f.name), f.args));
          },
          [&](const auto&) { return p; }},
      p->get());
}

Rebinder::mk_pat_t Rebinder::mk_pat(const TermPtr& v) {
  ForcerImpl::DepthGuard guard(forcer_);
  if (*v == *target_term_) return {target_, 1};
  if (!v->is_con()) return {};

  const auto& c = v->as_con();
  const auto args = all_apply_elims(c.elims);
  if (!args) {
    throw std::logic_error(fmt::format(
        "Constructor {} applied to a projection or path point", c.name));
  }
  const auto& fs = forcer_.signature_.forced_annotations(c.name);
  std::optional<std::size_t> first;
  PatternPtr sub;
  std::size_t candidates = 0;
  for (std::size_t j = 0; j < args->size(); ++j) {
    if (is_forced(forced_at(fs, j))) continue;
    auto [q, n] = mk_pat((*args)[j].term);
    if (!q) continue;
    candidates += n;
    if (!first) {
      first = j;
      sub = std::move(q);
    }
  }
  if (!first) return {};

  PatternList ps;
  ps.reserve(args->size());
  for (std::size_t j = 0; j < args->size(); ++j) {
    const auto& a = (*args)[j];
    ps.push_back(NamedArg{a.modality, std::nullopt,
                          j == *first ? sub : Pattern::dotted(a.term)});
  }
  return {Pattern::constructor(c.name, ConPatternInfo{.lazy = true},
                               std::move(ps)),
          candidates};
}

PatternList ForcerImpl::rebind_forced_pattern(const PatternList& ps,
                                              const Pattern& target) {
  const auto context = rebind_context(ps, target);
  trace(50, [&] {
    return fmt::format("rebinding {} in {}", print_pattern(target, context),
                       print_patterns(ps, context));
  });
  Rebinder rebinder(*this, target);
  auto result = rebinder.rebind({}, ps);
  if (rebinder.count() == 0) {
    throw std::logic_error(
        fmt::format("Forced pattern {} has no dot pattern to move to in {}",
                    print_pattern(target, context),
                    print_patterns(ps, context)));
  }
  if (rebinder.count() > 1 && !target.is_variable()) {
    throw ForcingError(
        fmt::format(
            "Cannot determine where to move the forced pattern {} in clause "
            "{}",
            print_pattern(target, context), print_patterns(ps, context)),
        location_);
  }
  trace(50,
        [&] { return fmt::format("  result: {}", print_patterns(result)); });
  return result;
}

PatternList ForcerImpl::forcing_translation(const PatternList& ps) {
  PatternList current = ps;
  std::optional<std::size_t> previous;
  while (true) {
    auto dotted = dot_forced_patterns(current);
    auto& qs = dotted.patterns;
    const auto& rebind = dotted.rebind;
    trace(50, [&] {
      std::vector<std::string> rs;
      for (const auto& r : rebind) {
        rs.push_back(print_pattern(*r, pattern_context(current)));
      }
      return fmt::format(
          "forcingTranslation\n  patterns: {}\n  dotted:   {}\n  rebind:   "
          "[{}]",
          print_patterns(current), print_patterns(qs), fmt::join(rs, ", "));
    });
    if (rebind.empty()) return qs;

    const auto size = total_size(rebind);
    if (previous && size >= *previous) {
      throw std::logic_error(
          fmt::format("Forcing translation of {} does not shrink: {} "
                      "patterns to move after {}",
                      print_patterns(ps), size, *previous));
    }
    previous = size;

    for (const auto& r : rebind) qs = rebind_forced_pattern(qs, *r);
    current = std::move(qs);
  }
}

Telescope ForcerImpl::force_translate_telescope(const Telescope& delta,
                                                const PatternList& ps) {
  return update_telescope(delta, ps, forcing_translation(ps));
}

// `qs` is the translation of `ps`.
Telescope ForcerImpl::update_telescope(const Telescope& delta,
                                       const PatternList& ps,
                                       const PatternList& qs) {
  const auto before = pattern_var_modalities(ps);
  const auto after = pattern_var_modalities(qs);
  const auto added = multiset_difference(after, before);
  if (added.empty()) return delta;

  trace(40, [&] {
    return fmt::format(
        "Updating modalities of forced arguments\n  from: {}\n  to:   {}",
        print_var_modalities(multiset_difference(before, after)),
        print_var_modalities(added));
  });
  Telescope result = delta;
  for (std::size_t k = 0; k < result.size(); ++k) {
    const auto i = index_of_position(result, k);
    const auto it = std::find_if(
        added.begin(), added.end(),
        [i](const pattern_var_modality_t& xm) { return xm.first.index == i; });
    if (it != added.end()) result[k].modality = it->second;
  }
  trace(60, [&] {
    return fmt::format("  delta' = {}", print_telescope(result));
  });
  return result;
}

Forcer::Forcer(const Signature& signature, Reporter& reporter, Options options)
    : impl_(std::make_unique<ForcerImpl>(signature, reporter,
                                         std::move(options))) {}

Forcer::~Forcer() = default;

const Options& Forcer::options() const { return impl_->options_; }

ForcedAnnotations Forcer::compute_forcing_annotations(
    std::string_view name, const TermPtr& type, const Location& location) {
  impl_->set_location(location);
  return impl_->compute_forcing_annotations(name, type);
}

Forcer::dot_forced_t Forcer::dot_forced_patterns(const PatternList& ps) {
  return impl_->dot_forced_patterns(ps);
}

PatternList Forcer::rebind_forced_pattern(const PatternList& ps,
                                          const Pattern& target,
                                          const Location& location) {
  impl_->set_location(location);
  return impl_->rebind_forced_pattern(ps, target);
}

PatternList Forcer::forcing_translation(const PatternList& ps,
                                        const Location& location) {
  impl_->set_location(location);
  return impl_->forcing_translation(ps);
}

Telescope Forcer::force_translate_telescope(const Telescope& delta,
                                            const PatternList& ps,
                                            const Location& location) {
  impl_->set_location(location);
  return impl_->force_translate_telescope(delta, ps);
}

Forcer::translated_clause_t Forcer::force_translate_clause(
    const Telescope& delta, const PatternList& ps, const Location& location) {
  impl_->set_location(location);
  auto qs = impl_->forcing_translation(ps);
  auto telescope = impl_->update_telescope(delta, ps, qs);
  return {std::move(telescope), std::move(qs)};
}

}  // namespace forcer
