#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tracer/StackTrace.hpp"

using namespace tracer;

TEST(StackTraceTest, ParseSplitsMemberAndLocation) {
  const StackTrace trace = StackTrace::parse(
      " #0  handleRequest at server.cpp:42\n"
      "\n"
      "1# main at main.cpp:7\n"
      "0x7f00deadbeef\n");
  const std::vector<Frame> expected = {
      Frame{"server.cpp:42", "handleRequest"},
      Frame{"main.cpp:7", "main"},
      Frame{"0x7f00deadbeef", ""},
  };
  EXPECT_EQ(trace.frames(), expected);
}

TEST(StackTraceTest, ParseKeepsLinesThatOnlyLookNumbered) {
  const StackTrace trace = StackTrace::parse("404notfound at x.cpp:1\n#");
  ASSERT_EQ(trace.size(), 2u);
  EXPECT_EQ(trace.frames()[0].m_member, "404notfound");
  EXPECT_EQ(trace.frames()[1].m_location, "#");
}

TEST(StackTraceTest, ParseOfBlankTextIsEmpty) {
  EXPECT_TRUE(StackTrace::parse("").empty());
  EXPECT_TRUE(StackTrace::parse(" \n\t\n").empty());
}

TEST(StackTraceTest, KeepAllFoldIsIdentity) {
  const StackTrace trace{{Frame{"a", "f"}, Frame{"b", "g"}}};
  EXPECT_EQ(trace.fold(folds::KeepAll()).frames(), trace.frames());
}

TEST(StackTraceTest, FoldCollapsesEachRunSeparately) {
  const StackTrace trace{{Frame{"/usr/lib/a", "x"}, Frame{"/usr/lib/b", "y"},
                          Frame{"app.cpp", "main"}, Frame{"/usr/lib/c", "z"}}};
  const std::vector<Frame> expected = {
      Frame{"/usr/lib/b", ""},
      Frame{"app.cpp", "main"},
      Frame{"/usr/lib/c", ""},
  };
  EXPECT_EQ(trace.fold(folds::LocationPrefix({"/usr/lib"})).frames(), expected);
}

TEST(StackTraceTest, TerseDropsBlankFrames) {
  const StackTrace trace{{Frame{"a", "f"}, Frame{"", ""}, Frame{"b", "g"}}};
  EXPECT_EQ(trace.fold(folds::KeepAll(), false).size(), 3u);
  EXPECT_EQ(trace.fold(folds::KeepAll(), true).size(), 2u);
}

TEST(StackTraceTest, ToStringAlignsMembers) {
  const StackTrace trace{{Frame{"short", "f"}, Frame{"much_longer", "g"}}};
  EXPECT_EQ(trace.toString(), "short        f\nmuch_longer  g\n");
}

TEST(StackTraceTest, CurrentCapturesFrames) {
  const StackTrace trace = StackTrace::current();
  EXPECT_FALSE(trace.empty());
  for (const Frame &frame : trace.frames())
    EXPECT_FALSE(frame.m_location.empty());
}
