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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "testing/test_util.h"

namespace forcer::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(SignatureTest, AddsAndLooksUpDefinitions) {
  MemorySignature sig;
  sig.add_data("Nat", Term::sort());
  sig.add_constructor("zero", "Nat", def("Nat"));
  sig.add_constructor("suc", "Nat", pi("n", def("Nat"), def("Nat")),
                      {IsForced::NotForced});
  sig.add_function("f", nullptr, {IsForced::Forced});

  EXPECT_TRUE(sig.contains("Nat"));
  EXPECT_FALSE(sig.contains("Fin"));
  EXPECT_TRUE(sig.is_data_type("Nat"));
  EXPECT_FALSE(sig.is_data_type("suc"));
  EXPECT_FALSE(sig.is_data_type("Fin"));
  EXPECT_EQ(sig.lookup("suc").kind, DefinitionKind::Constructor);
  EXPECT_EQ(sig.lookup("suc").data, "Nat");
  EXPECT_THAT(sig.lookup("Nat").constructors, ElementsAre("zero", "suc"));
  EXPECT_THAT(sig.forced_annotations("zero"), IsEmpty());
  EXPECT_THAT(sig.forced_annotations("f"), ElementsAre(IsForced::Forced));
}

TEST(SignatureTest, RejectsDuplicates) {
  MemorySignature sig;
  sig.add_data("Nat");
  EXPECT_THROW(sig.add_data("Nat"), std::invalid_argument);
  EXPECT_THROW(sig.add_function("Nat"), std::invalid_argument);
  sig.add_constructor("zero", "Nat", def("Nat"));
  EXPECT_THROW(sig.add_constructor("zero", "Nat", def("Nat")),
               std::invalid_argument);
  EXPECT_THAT(sig.lookup("Nat").constructors, ElementsAre("zero"));
}

TEST(SignatureTest, UnknownNamesAreInternalErrors) {
  MemorySignature sig;
  EXPECT_THROW(sig.lookup("x"), std::logic_error);
  EXPECT_THROW(sig.forced_annotations("x"), std::logic_error);
  EXPECT_THROW(sig.add_constructor("c", "Missing", def("Missing")),
               std::logic_error);
  EXPECT_THROW(sig.set_forced("x", {}), std::logic_error);
  sig.add_data("D");
  EXPECT_THROW(sig.set_forced("D", {IsForced::Forced}), std::logic_error);
}

TEST(SignatureTest, SetForcedReplacesAnnotations) {
  MemorySignature sig;
  sig.add_function("f");
  sig.set_forced("f", {IsForced::Forced, IsForced::NotForced});
  EXPECT_THAT(sig.forced_annotations("f"),
              ElementsAre(IsForced::Forced, IsForced::NotForced));
}

TEST(SignatureTest, EtaConstructors) {
  MemorySignature sig;
  sig.add_data("Unit", Term::sort(), true);
  sig.add_constructor("tt", "Unit", def("Unit"));
  sig.add_data("Bool", Term::sort(), true);
  sig.add_constructor("true", "Bool", def("Bool"));
  sig.add_constructor("false", "Bool", def("Bool"));
  sig.add_data("Nat");
  sig.add_constructor("zero", "Nat", def("Nat"));

  EXPECT_TRUE(sig.is_eta_constructor("tt"));
  EXPECT_FALSE(sig.is_eta_constructor("true"));
  EXPECT_FALSE(sig.is_eta_constructor("zero"));
  EXPECT_FALSE(sig.is_eta_constructor("Unit"));
}

}  // namespace
}  // namespace forcer::testing
