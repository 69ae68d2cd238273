#include "orrery/core/CVar.h"
#include "orrery/core/Log.h"
#include "tests/test_harness.h"

#include <atomic>
#include <string>

using namespace orrery;

namespace {

struct Capture {
  std::atomic<int> count{0};
  core::LogLevel lastLevel{core::LogLevel::Trace};
  std::string lastMessage;
};

void captureSink(core::LogLevel level, std::string_view /*ts*/, std::string_view msg, void* user) {
  auto* cap = reinterpret_cast<Capture*>(user);
  if (!cap) return;
  cap->count.fetch_add(1, std::memory_order_relaxed);
  cap->lastLevel = level;
  cap->lastMessage = std::string(msg);
}

} // namespace

int test_log_sinks() {
  int failures = 0;

  const core::LogLevel prev = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Trace);

  Capture cap;
  const core::LogSink sink{&captureSink, &cap};

  core::addLogSink(sink);
  ORRERY_LOG_INFO("hello");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);
  CHECK(cap.lastLevel == core::LogLevel::Info);
  CHECK(cap.lastMessage == "hello");

  // Removing should stop callbacks.
  core::removeLogSink(sink);
  ORRERY_LOG_INFO("world");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);

  // Respect log-level filtering.
  core::addLogSink(sink);
  core::setLogLevel(core::LogLevel::Warn);
  ORRERY_LOG_DEBUG("filtered");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);
  ORRERY_LOG_WARN("kept");
  CHECK(cap.count.load(std::memory_order_relaxed) == 2);

  core::setLogLevel(core::LogLevel::Off);
  ORRERY_LOG_ERROR("should_not_fire");
  CHECK(cap.count.load(std::memory_order_relaxed) == 2);

  // Level names.
  core::LogLevel parsed = core::LogLevel::Off;
  CHECK(core::parseLogLevel(" Debug ", parsed) && parsed == core::LogLevel::Debug);
  CHECK(!core::parseLogLevel("loud", parsed));
  CHECK(core::toString(core::LogLevel::Warn) == "WARN ");

  // The log.level cvar drives the global filter.
  {
    core::CVarRegistry r;
    core::installDefaultCVars(r);
    CHECK(r.exists("log.level"));
    CHECK(r.setString("log.level", "error"));
    CHECK(core::getLogLevel() == core::LogLevel::Error);
    CHECK(r.setFromString("log.level", "trace"));
    CHECK(core::getLogLevel() == core::LogLevel::Trace);
  }

  // Restore.
  core::removeLogSink(sink);
  core::setLogLevel(prev);
  return failures;
}
