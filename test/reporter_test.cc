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

#include "forcer/reporter.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "forcer/location.h"

namespace forcer::testing {
namespace {

class PrintingReporterTest : public ::testing::Test {
 protected:
  std::FILE* out = std::tmpfile();

  ~PrintingReporterTest() override {
    if (out) std::fclose(out);
  }

  std::string contents() {
    std::fflush(out);
    std::rewind(out);
    std::string s;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), out)) s += buf;
    return s;
  }
};

TEST_F(PrintingReporterTest, PrintsErrorsWithLocation) {
  ASSERT_NE(out, nullptr);
  PrintingReporter reporter(out);
  reporter.report_error(Location{"proj.agda", 4}, "bad clause");
  reporter.report_warning(Location{"proj.agda", 5}, "odd clause");
  EXPECT_EQ(contents(),
            "proj.agda:4: error: bad clause\n"
            "proj.agda:5: warning: odd clause\n");
}

TEST_F(PrintingReporterTest, PrintsInfoAndTraces) {
  ASSERT_NE(out, nullptr);
  PrintingReporter reporter(out);
  reporter.report_info("fzero : [Forced]");
  reporter.report_trace("tc.force", 50, "rebinding n");
  EXPECT_EQ(contents(), "fzero : [Forced]\n[tc.force:50] rebinding n\n");
}

}  // namespace
}  // namespace forcer::testing
