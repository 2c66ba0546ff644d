#include <gtest/gtest.h>

#include <string>

#include "TestUtil.hpp"
#include "tracer/Handlers.hpp"

using namespace tracer;
using tracer::test::makeEvent;

TEST(ConsoleHandlerTest, WritesColoredLineToStdoutByDefault) {
  auto handler = handlers::Console();
  const Event event = makeEvent(Level::Error, "boom");

  testing::internal::CaptureStdout();
  handler->handle(event);
  EXPECT_EQ(testing::internal::GetCapturedStdout(),
            generatedMessageColored(event) + "\n");
}

TEST(ConsoleHandlerTest, PlainWhenColorsAreDisabled) {
  auto handler = handlers::Console(false);
  const Event event = makeEvent(Level::Info, "hello", "line\nnext");

  testing::internal::CaptureStdout();
  handler->handle(event);
  EXPECT_EQ(testing::internal::GetCapturedStdout(),
            generatedMessage(event) + "\n");
}

TEST(ConsoleHandlerTest, SplitsStreamsByLevelWhenEnabled) {
  auto handler = handlers::Console(false, true);
  const Event info = makeEvent(Level::Info, "to stdout");
  const Event error = makeEvent(Level::Error, "to stderr");

  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  handler->handle(info);
  handler->handle(error);
  const std::string err = testing::internal::GetCapturedStderr();
  const std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out, generatedMessage(info) + "\n");
  EXPECT_EQ(err, generatedMessage(error) + "\n");
}

TEST(ConsoleHandlerTest, SimpleConsolePrintsLevelAndBody) {
  auto handler = handlers::SimpleConsole();

  testing::internal::CaptureStdout();
  handler->handle(makeEvent(Level::Info, "hello"));
  handler->handle(makeEvent(Level::Error, "bad", "ignored description"));
  handler->handle(makeEvent(Level::Warn, "careful"));
  EXPECT_EQ(testing::internal::GetCapturedStdout(),
            "info > hello\nerror> bad\nwarn > careful\n");
}
