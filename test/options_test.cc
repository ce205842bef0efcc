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

#include "forcer/options.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace forcer::testing {
namespace {

TEST(OptionsTest, Defaults) {
  const Options options;
  EXPECT_TRUE(options.forcing);
  EXPECT_EQ(options.max_depth, 1024u);
  EXPECT_FALSE(options.verbosity.enabled("tc.force", 1));
  EXPECT_TRUE(options.verbosity.enabled("tc.force", 0));
}

TEST(VerbosityTest, ExactTag) {
  const auto v = Verbosity::parse("tc.force:50");
  EXPECT_TRUE(v.enabled("tc.force", 40));
  EXPECT_TRUE(v.enabled("tc.force", 50));
  EXPECT_FALSE(v.enabled("tc.force", 60));
  EXPECT_FALSE(v.enabled("tc.conv", 10));
}

TEST(VerbosityTest, PrefixesCoverSubtags) {
  const auto v = Verbosity::parse("tc:40");
  EXPECT_TRUE(v.enabled("tc.force", 40));
  EXPECT_TRUE(v.enabled("tc", 40));
  EXPECT_FALSE(v.enabled("tcx", 1));

  const auto partial = Verbosity::parse("tc.f:60");
  EXPECT_FALSE(partial.enabled("tc.force", 1));
}

TEST(VerbosityTest, LongestKeyWins) {
  const auto v = Verbosity::parse("tc:60,tc.force:10");
  EXPECT_FALSE(v.enabled("tc.force", 60));
  EXPECT_TRUE(v.enabled("tc.force", 10));
  EXPECT_TRUE(v.enabled("tc.conv", 60));
  EXPECT_TRUE(v.enabled("tc.force.rebind", 10));
  EXPECT_FALSE(v.enabled("tc.force.rebind", 11));
}

TEST(VerbosityTest, EmptyKeyCoversEverything) {
  const auto v = Verbosity::parse(":30");
  EXPECT_TRUE(v.enabled("anything", 30));
}

TEST(VerbosityTest, Set) {
  Verbosity v;
  v.set("tc.force", 20);
  EXPECT_TRUE(v.enabled("tc.force", 20));
  v.set("tc.force", 5);
  EXPECT_FALSE(v.enabled("tc.force", 20));
}

TEST(VerbosityTest, ParsesWhitespaceAndEmptyEntries) {
  const auto v = Verbosity::parse(" tc : 5 ,, x:1 ");
  EXPECT_TRUE(v.enabled("tc", 5));
  EXPECT_TRUE(v.enabled("x", 1));
  EXPECT_FALSE(Verbosity::parse("").enabled("tc", 1));
}

TEST(VerbosityTest, RejectsMalformedEntries) {
  EXPECT_THROW(Verbosity::parse("tc"), std::invalid_argument);
  EXPECT_THROW(Verbosity::parse("tc:"), std::invalid_argument);
  EXPECT_THROW(Verbosity::parse("tc:x"), std::invalid_argument);
  EXPECT_THROW(Verbosity::parse("tc:5x"), std::invalid_argument);
  EXPECT_THROW(Verbosity::parse("tc:5,oops"), std::invalid_argument);
}

}  // namespace
}  // namespace forcer::testing
