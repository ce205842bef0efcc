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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "testing/test_util.h"

namespace forcer::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::Pair;
using ::testing::VariantWith;

TEST(PatternTest, Prints) {
  const PatternList ps{pdot(con("suc", {v(0)})),
                       pcon("fzero", {pvar("n", 0)})};
  EXPECT_EQ(print_patterns(ps), ".(suc n) (fzero n)");

  EXPECT_EQ(print_pattern(*Pattern::projection("fst")), ".fst");
  EXPECT_EQ(print_pattern(*Pattern::literal(mpz_class(7))), "7");
  EXPECT_EQ(
      print_pattern(*pfun("pf", {pvar("a", 1), pvar("b", 0)}).pattern),
      "(pf a b)");
  EXPECT_EQ(print_pattern(*pdot(v(0)).pattern, {"x"}), ".x");
  EXPECT_EQ(print_pattern(*pvar("", 4).pattern), "@4");
}

TEST(PatternTest, PrintsNestedConstructorsInParentheses) {
  const PatternList ps{pcon("suc", {pcon("suc", {pvar("n", 0)})}),
                       pcon("zero")};
  EXPECT_EQ(print_patterns(ps), "(suc (suc n)) zero");
}

TEST(PatternTest, HidesForcedDotPatternsWhenGivenASignature) {
  Prelude prelude;
  const PatternList ps{plazy("suc", {pvar("n", 0)}),
                       pcon("fzero", {pdot(v(0))})};
  EXPECT_EQ(print_patterns(ps), "(suc n) (fzero .n)");
  EXPECT_EQ(print_patterns(ps, prelude.signature), "(suc n) fzero");

  const PatternList qs{plazy("suc", {pvar("n", 1)}),
                       pcon("fsuc", {pdot(v(1)), pvar("i", 0)})};
  EXPECT_EQ(print_patterns(qs, prelude.signature), "(suc n) (fsuc i)");
}

TEST(PatternTest, ComparesStructurally) {
  EXPECT_EQ(pcon("suc", {pvar("n", 0)}), pcon("suc", {pvar("n", 0)}));
  EXPECT_NE(pcon("suc", {pvar("n", 0)}), pcon("suc", {pvar("m", 0)}));
  EXPECT_NE(pcon("suc", {pvar("n", 0)}), plazy("suc", {pvar("n", 0)}));
  EXPECT_NE(pvar("n", 0), pvar("n", 0, Modality::erased()));
  EXPECT_NE(pdot(v(0)), pvar("n", 0));
}

TEST(PatternTest, ConvertsToTerms) {
  EXPECT_EQ(*pattern_to_term(*pcon("suc", {pvar("n", 0)}).pattern),
            *con("suc", {v(0)}));
  EXPECT_EQ(*pattern_to_term(*pdot(con("zero")).pattern), *con("zero"));
  EXPECT_EQ(*pattern_to_term(*plit(3).pattern), *nat(3));
  EXPECT_EQ(*pattern_to_term(*pfun("pf", {pvar("a", 0)}).pattern),
            *def("pf", {v(0)}));
  EXPECT_EQ(*pattern_to_term(*Pattern::path_application(
                con("zero"), con("zero"), PatVar{"i", 2})),
            *v(2));
  EXPECT_THROW(pattern_to_term(*Pattern::projection("fst")),
               std::logic_error);
}

TEST(PatternTest, ConvertsToElims) {
  const PatternList ps{pvar("x", 1, Modality::irrelevant()),
                       NamedArg{{}, std::nullopt, Pattern::projection("fst")}};
  EXPECT_THAT(patterns_to_elims(ps),
              ElementsAre(Elim(apply(v(1), Modality::irrelevant())),
                          VariantWith<Proj>(Proj{"fst"})));
}

TEST(PatternTest, Rebinds) {
  const auto x = pvar("x", 0).pattern;
  EXPECT_TRUE(rebinds(*x, *pdot(con("zero")).pattern));
  EXPECT_TRUE(rebinds(*x, *pvar("y", 0).pattern));
  EXPECT_FALSE(rebinds(*x, *pvar("x", 1).pattern));
  EXPECT_FALSE(rebinds(*pdot(v(0)).pattern, *x));

  EXPECT_TRUE(rebinds(*pcon("suc", {pvar("n", 0)}).pattern,
                      *pcon("suc", {pdot(v(3))}).pattern));
  EXPECT_FALSE(rebinds(*pcon("suc", {pvar("n", 0)}).pattern,
                       *pcon("fsuc", {pvar("n", 0)}).pattern));
  EXPECT_FALSE(rebinds(*pcon("c", {pvar("n", 0)}).pattern,
                       *pcon("c", {pvar("n", 0), pvar("m", 1)}).pattern));
  EXPECT_TRUE(rebinds(*plit(2).pattern, *plit(2).pattern));
  EXPECT_FALSE(rebinds(*plit(2).pattern, *plit(3).pattern));
}

TEST(PatternTest, BindsVariables) {
  EXPECT_TRUE(binds_variables(*pvar("x", 0).pattern));
  EXPECT_TRUE(
      binds_variables(*pcon("suc", {pcon("suc", {pvar("n", 0)})}).pattern));
  EXPECT_FALSE(binds_variables(*pcon("suc", {pdot(v(0))}).pattern));
  EXPECT_FALSE(binds_variables(*pcon("tt").pattern));
  EXPECT_FALSE(binds_variables(*plit(1).pattern));
  EXPECT_TRUE(binds_variables(*Pattern::path_application(
      con("zero"), con("zero"), PatVar{"i", 0})));
}

TEST(PatternTest, Size) {
  EXPECT_EQ(pattern_size(*pcon("suc", {pcon("suc", {pvar("n", 0)})}).pattern),
            3u);
  EXPECT_EQ(pattern_size(*pdot(con("suc", {v(0)})).pattern), 1u);
  EXPECT_EQ(pattern_size(*pfun("pf", {pvar("a", 1), pvar("b", 0)}).pattern),
            3u);
}

TEST(PatternTest, VariableModalitiesComposeAlongThePath) {
  const PatternList ps{
      pvar("x", 2, Modality::erased(true)),
      pcon("c", {pvar("y", 1, Modality::irrelevant()), pdot(v(2))}),
      pvar("z", 0)};
  EXPECT_THAT(
      pattern_var_modalities(ps),
      ElementsAre(
          Pair(PatVar{"x", 2},
               Modality{Relevance::Relevant, Quantity::Zero, true}),
          Pair(PatVar{"y", 1},
               Modality{Relevance::Irrelevant, Quantity::Omega, false}),
          Pair(PatVar{"z", 0}, Modality{})));
  EXPECT_THAT(pattern_context(ps), ElementsAre("z", "y", "x"));
}

}  // namespace
}  // namespace forcer::testing
