#include <cassert>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "batchkin/core/common/logger.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/rotation.hpp"

namespace bk = batchkin::core;
using batchkin::core::LogLevel;
using batchkin::core::Status;

static std::vector<std::string> g_lines;

static void captureSink(LogLevel level, const std::string& msg) {
  g_lines.push_back(std::string(bk::logLevelToString(level)) + " " + msg);
}

static void test_parse_level() {
  LogLevel level = LogLevel::Warn;
  assert(bk::parseLogLevel("DEBUG", &level) && level == LogLevel::Debug);
  assert(bk::parseLogLevel("error", &level) && level == LogLevel::Error);
  assert(bk::parseLogLevel("Warning", &level) && level == LogLevel::Warn);
  assert(!bk::parseLogLevel("verbose", &level));
  assert(level == LogLevel::Warn);
  assert(!bk::parseLogLevel("info", nullptr));
}

static void test_level_filtering() {
  g_lines.clear();
  bk::setLogSink(&captureSink);
  assert(bk::getLogSink() == &captureSink);

  bk::setLogLevel(LogLevel::Warn);
  assert(bk::getLogLevel() == LogLevel::Warn);
  assert(bk::shouldLog(LogLevel::Error));
  assert(!bk::shouldLog(LogLevel::Info));
  bk::log(LogLevel::Info, "hidden");
  bk::log(LogLevel::Warn, "shown");
  assert(g_lines.size() == 1);
  assert(g_lines[0] == "WARN shown");

  bk::setLogLevel(LogLevel::Debug);
  bk::log(LogLevel::Debug, std::string("visible"));
  assert(g_lines.size() == 2);

  bk::setLogSink(nullptr);
  assert(bk::getLogSink() != &captureSink);
  bk::setLogLevel(LogLevel::Warn);
}

static void test_rejections_are_logged() {
  g_lines.clear();
  bk::setLogSink(&captureSink);
  bk::setLogLevel(LogLevel::Warn);

  bk::BatchArray R;
  const Status st = bk::quaternionToRotationMatrix(bk::BatchArray::Zero(2, 3), &R);
  assert(st == Status::ShapeMismatch);
  // One error line naming the operation.
  assert(g_lines.size() == 1);
  assert(g_lines[0].rfind("ERROR quaternionToRotationMatrix:", 0) == 0);

  assert(bk::logFailure(Status::Failure, "op", "msg") == Status::Failure);
  assert(g_lines.back() == "ERROR op: msg");

  bk::setLogSink(nullptr);
}

static void test_status_strings() {
  assert(std::strcmp(bk::statusToString(Status::Success), "Success") == 0);
  assert(std::strcmp(bk::statusToString(Status::ShapeMismatch), "ShapeMismatch") == 0);
  assert(std::strcmp(bk::statusToString(Status::Construction), "Construction") == 0);
  assert(bk::ok(Status::Success));
  assert(!bk::ok(Status::NonFinite));
}

int main() {
  test_parse_level();
  test_level_filtering();
  test_rejections_are_logged();
  test_status_strings();
  std::cout << "batchkin_logger_test: PASS\n";
  return 0;
}
