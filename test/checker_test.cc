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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "testing/test_util.h"

namespace forcer::testing {
namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;

DataDecl nat_decl() {
  return DataDecl{
      .location = {"nat.agda", 1},
      .name = "Nat",
      .type = Term::sort(),
      .constructors = {
          ConstructorDecl{"zero", def("Nat")},
          ConstructorDecl{"suc", pi("n", def("Nat"), def("Nat"))}}};
}

DataDecl fin_decl() {
  return DataDecl{
      .location = {"fin.agda", 1},
      .name = "Fin",
      .type = pi("_", def("Nat"), Term::sort()),
      .constructors = {
          ConstructorDecl{
              "fzero", pi("n", def("Nat"), def("Fin", {con("suc", {v(0)})}))},
          ConstructorDecl{
              "fsuc", pi("n", def("Nat"),
                         pi("i", def("Fin", {v(0)}),
                            def("Fin", {con("suc", {v(1)})})))}}};
}

DataDecl eq_decl() {
  return DataDecl{
      .location = {"eq.agda", 1},
      .name = "Eq2",
      .type = pi("_", def("Nat"), pi("_", def("Nat"), Term::sort())),
      .constructors = {ConstructorDecl{
          "refl2", pi("n", def("Nat"), def("Eq2", {v(0), v(0)}))}}};
}

class CheckerTest : public ::testing::Test {
 protected:
  NiceMock<MockReporter> reporter;
  Checker checker{reporter};

  void SetUp() override {
    ASSERT_TRUE(checker.check(nat_decl()));
    ASSERT_TRUE(checker.check(fin_decl()));
  }
};

TEST_F(CheckerTest, RecordsConstructorAnnotations) {
  const auto& sig = checker.signature();
  EXPECT_THAT(sig.forced_annotations("suc"), ElementsAre(IsForced::NotForced));
  EXPECT_THAT(sig.forced_annotations("fsuc"),
              ElementsAre(IsForced::Forced, IsForced::NotForced));
  EXPECT_EQ(sig.lookup("fzero").data, "Fin");
  EXPECT_THAT(sig.lookup("Fin").constructors, ElementsAre("fzero", "fsuc"));
}

TEST_F(CheckerTest, ReportsAnnotations) {
  EXPECT_CALL(reporter, report_info("refl2 : [Forced]"));
  EXPECT_TRUE(checker.check(eq_decl()));
}

TEST_F(CheckerTest, TranslatesFunctionClauses) {
  FunctionDecl proj{
      .location = {"proj.agda", 3},
      .name = "proj",
      .type = pi("m", def("Nat"), pi("i", def("Fin", {v(0)}), def("Nat"))),
      .clauses = {
          Clause{{"proj.agda", 4},
                 {Dom{"n", def("Nat"), {}}},
                 {pdot(con("suc", {v(0)})), pcon("fzero", {pvar("n", 0)})}},
          Clause{{"proj.agda", 5},
                 {Dom{"n", def("Nat"), {}}, Dom{"i", def("Fin", {v(0)}), {}}},
                 {pdot(con("suc", {v(1)})),
                  pcon("fsuc", {pvar("n", 1), pvar("i", 0)})}}}};
  ASSERT_TRUE(checker.check(proj));

  const auto& clauses = checker.clauses("proj");
  ASSERT_EQ(clauses.size(), 2u);
  EXPECT_EQ(print_patterns(clauses[0].patterns, checker.signature()),
            "(suc n) fzero");
  EXPECT_EQ(print_patterns(clauses[1].patterns, checker.signature()),
            "(suc n) (fsuc i)");
  EXPECT_EQ(clauses[1].telescope, proj.clauses[1].telescope);
  EXPECT_TRUE(checker.signature().contains("proj"));
}

TEST_F(CheckerTest, ContinuesAfterAmbiguousDefinition) {
  ASSERT_TRUE(checker.check(eq_decl()));
  FunctionDecl bad{
      .location = {"bad.agda", 6},
      .name = "bad",
      .clauses = {Clause{{"bad.agda", 7},
                         {Dom{"m", def("Nat"), {}}},
                         {pdot(con("suc", {v(0)})), pdot(con("suc", {v(0)})),
                          pcon("refl2", {pcon("suc", {pvar("m", 0)})})}}}};
  FunctionDecl good{
      .location = {"good.agda", 9},
      .name = "good",
      .clauses = {Clause{{"good.agda", 10},
                         {Dom{"m", def("Nat"), {}}},
                         {pdot(v(0)), pdot(v(0)),
                          pcon("refl2", {pvar("m", 0)})}}}};

  EXPECT_CALL(reporter,
              report_error(AllOf(Field(&Location::filename, "bad.agda"),
                                 Field(&Location::line, 7)),
                           HasSubstr("Cannot determine where to move")));
  EXPECT_FALSE(checker.check(bad));
  EXPECT_THROW(checker.clauses("bad"), std::logic_error);

  EXPECT_CALL(reporter, report_error(_, _)).Times(0);
  ASSERT_TRUE(checker.check(good));
  EXPECT_EQ(print_patterns(checker.clauses("good")[0].patterns),
            "m .m (refl2 .m)");
}

TEST_F(CheckerTest, ReportsDuplicateDefinitions) {
  EXPECT_CALL(reporter,
              report_error(Field(&Location::filename, "nat.agda"),
                           HasSubstr("Nat is already defined as a DataType")));
  EXPECT_FALSE(checker.check(nat_decl()));

  DataDecl twice{.location = {"twice.agda", 2},
                 .name = "Twice",
                 .constructors = {ConstructorDecl{"t", def("Twice")},
                                  ConstructorDecl{"t", def("Twice")}}};
  EXPECT_CALL(reporter, report_error(Field(&Location::line, 2),
                                     HasSubstr("declared twice")));
  EXPECT_FALSE(checker.check(twice));
  EXPECT_FALSE(checker.signature().contains("Twice"));
}

TEST_F(CheckerTest, ConstructorTargetMustBeADataType) {
  DataDecl broken{
      .location = {"broken.agda", 1},
      .name = "Broken",
      .constructors = {
          ConstructorDecl{"b", pi("n", def("Nat"), Term::sort())}}};
  EXPECT_THROW(checker.check(broken), std::logic_error);
}

TEST(CheckerOptionsTest, TranslatesEachClauseOnce) {
  NiceMock<MockReporter> reporter;
  Checker checker(reporter,
                  Options{.verbosity = Verbosity::parse("tc.force:50")});
  ASSERT_TRUE(checker.check(nat_decl()));
  ASSERT_TRUE(checker.check(fin_decl()));

  EXPECT_CALL(reporter, report_trace(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(reporter,
              report_trace(Eq("tc.force"), 50, HasSubstr("rebinding")))
      .Times(1);
  ASSERT_TRUE(checker.check(FunctionDecl{
      .name = "proj",
      .clauses = {Clause{{},
                         {Dom{"n", def("Nat"), {}}},
                         {pdot(con("suc", {v(0)})),
                          pcon("fzero", {pvar("n", 0)})}}}}));
  EXPECT_EQ(print_patterns(checker.clauses("proj")[0].patterns,
                           checker.signature()),
            "(suc n) fzero");
}

TEST(CheckerOptionsTest, DisabledForcingLeavesClausesAlone) {
  NiceMock<MockReporter> reporter;
  Checker checker(reporter, Options{.forcing = false});
  ASSERT_TRUE(checker.check(nat_decl()));
  ASSERT_TRUE(checker.check(fin_decl()));
  const PatternList ps{pdot(con("suc", {v(0)})),
                       pcon("fzero", {pvar("n", 0)})};
  ASSERT_TRUE(checker.check(FunctionDecl{
      .name = "proj",
      .clauses = {Clause{{}, {Dom{"n", def("Nat"), {}}}, ps}}}));
  EXPECT_EQ(checker.clauses("proj")[0].patterns, ps);
  EXPECT_THAT(checker.signature().forced_annotations("fzero"),
              ElementsAre(IsForced::NotForced));
}

}  // namespace
}  // namespace forcer::testing
